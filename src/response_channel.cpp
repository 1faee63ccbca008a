/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlhttp/config.hpp"
#include "curlhttp/assert.hpp"
#include "curlhttp/logging.hpp"
#include "curlhttp/response_channel.hpp"

#include <algorithm>

namespace curlhttp {

	response_channel::response_channel(int const capacity)
		: m_capacity(std::max(capacity, 1))
	{}

	bool response_channel::push(stream_item item)
	{
		std::unique_lock<std::mutex> l(m_mutex);
		m_not_full.wait(l, [this] {
			return m_closed || m_ended || int(m_queue.size()) < m_capacity; });
		if (m_closed || m_ended) return false;
		if (std::holds_alternative<end_of_stream>(item)) m_ended = true;
		m_queue.push_back(std::move(item));
		l.unlock();
		m_not_empty.notify_one();
		return true;
	}

	std::optional<stream_item> response_channel::pop()
	{
		std::unique_lock<std::mutex> l(m_mutex);
		m_not_empty.wait(l, [this] { return m_closed || !m_queue.empty(); });
		if (m_queue.empty()) return std::nullopt;
		stream_item ret = std::move(m_queue.front());
		m_queue.pop_front();
		l.unlock();
		m_not_full.notify_one();
		return ret;
	}

	void response_channel::close()
	{
		{
			std::lock_guard<std::mutex> l(m_mutex);
			m_closed = true;
		}
		m_not_empty.notify_all();
		m_not_full.notify_all();
	}

	void response_channel::fail()
	{
		{
			std::lock_guard<std::mutex> l(m_mutex);
			m_closed = true;
			m_failed = true;
			// nobody will drain these
			m_queue.clear();
		}
		m_not_empty.notify_all();
		m_not_full.notify_all();
	}

	bool response_channel::closed() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_closed;
	}

	bool response_channel::ended() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_ended;
	}

	bool response_channel::failed() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_failed;
	}

	std::size_t response_channel::size() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_queue.size();
	}

	channel_consumer::channel_consumer(std::shared_ptr<response_channel> ch
		, item_handler handler)
		: m_channel(std::move(ch))
	{
		CURLHTTP_ASSERT(m_channel);
		m_thread = std::thread(&channel_consumer::run, this, std::move(handler));
	}

	channel_consumer::~channel_consumer()
	{
		if (!m_thread.joinable()) return;
		m_channel->close();
		m_thread.join();
	}

	void channel_consumer::run(item_handler handler)
	{
		aux::log(log_level::debug, "channel consumer %p started"
			, static_cast<void*>(m_channel.get()));
		try
		{
			for (;;)
			{
				std::optional<stream_item> item = m_channel->pop();
				if (!item) break;
				if (std::holds_alternative<end_of_stream>(*item))
				{
					m_channel->close();
					break;
				}
				handler(*item);
			}
		}
		catch (std::exception const& e)
		{
			aux::log(log_level::debug, "channel consumer %p failed: %s"
				, static_cast<void*>(m_channel.get()), e.what());
			m_error = std::current_exception();
			m_channel->fail();
			return;
		}
		catch (...)
		{
			m_error = std::current_exception();
			m_channel->fail();
			return;
		}
		aux::log(log_level::debug, "channel consumer %p done"
			, static_cast<void*>(m_channel.get()));
	}

	std::exception_ptr channel_consumer::join()
	{
		if (m_thread.joinable()) m_thread.join();
		std::exception_ptr ret = m_error;
		m_error = nullptr;
		return ret;
	}

	void channel_consumer::wait()
	{
		std::exception_ptr const e = join();
		if (e) std::rethrow_exception(e);
	}
}
