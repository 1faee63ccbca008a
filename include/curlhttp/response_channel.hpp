/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLHTTP_RESPONSE_CHANNEL_HPP_INCLUDED
#define CURLHTTP_RESPONSE_CHANNEL_HPP_INCLUDED

#include "curlhttp/config.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace curlhttp {

	// a block of response body bytes, copied out of libcurl's buffer
	struct data_chunk
	{
		std::vector<char> bytes;
	};

	// one response header line, including its line terminator
	struct header_line
	{
		std::string text;
	};

	// published when no more items will follow
	struct end_of_stream {};

	using stream_item = std::variant<data_chunk, header_line, end_of_stream>;

	// A bounded FIFO between libcurl's write/header callbacks (the producer)
	// and one consumer thread. push() blocks while the channel is full,
	// which stalls the transfer until the consumer catches up.
	//
	// Once closed, or once end_of_stream has been pushed, pushes are
	// rejected. Items already queued can still be popped, so a consumer sees
	// at most one end_of_stream.
	class CURLHTTP_EXPORT response_channel
	{
	public:
		explicit response_channel(int capacity);

		response_channel(response_channel const&) = delete;
		response_channel& operator=(response_channel const&) = delete;

		// returns false, without queuing the item, if the channel is closed
		bool push(stream_item item);

		// blocks until an item is available. Returns std::nullopt once the
		// channel is closed and drained.
		std::optional<stream_item> pop();

		void close();

		// closes the channel and marks it as failed. Used when the consumer
		// terminated by an exception.
		void fail();

		bool closed() const;
		// true once end_of_stream has been pushed
		bool ended() const;
		bool failed() const;
		std::size_t size() const;
		int capacity() const { return m_capacity; }

	private:
		mutable std::mutex m_mutex;
		std::condition_variable m_not_empty;
		std::condition_variable m_not_full;
		std::deque<stream_item> m_queue;
		int const m_capacity;
		bool m_closed = false;
		bool m_ended = false;
		bool m_failed = false;
	};

	// Runs ``handler`` on its own thread for every item popped from the
	// channel, until end_of_stream is popped or the channel is closed. An
	// exception thrown by the handler fails the channel and is rethrown by
	// wait().
	class CURLHTTP_EXPORT channel_consumer
	{
	public:
		using item_handler = std::function<void(stream_item&)>;

		channel_consumer(std::shared_ptr<response_channel> ch, item_handler handler);

		// closes the channel and joins the thread. An exception captured
		// from the handler and not collected by wait() is dropped.
		~channel_consumer();

		channel_consumer(channel_consumer const&) = delete;
		channel_consumer& operator=(channel_consumer const&) = delete;

		// joins the consumer thread, then rethrows the handler's exception,
		// if there was one. Must only be called after end_of_stream has been
		// pushed or the channel has been closed.
		void wait();

		// joins the consumer thread and returns the handler's exception,
		// if any, without throwing
		std::exception_ptr join();

		std::shared_ptr<response_channel> const& channel() const { return m_channel; }

	private:
		void run(item_handler handler);

		std::shared_ptr<response_channel> m_channel;
		std::exception_ptr m_error;
		std::thread m_thread;
	};
}

#endif
