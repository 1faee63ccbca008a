/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlhttp/config.hpp"
#include "curlhttp/multi_handle.hpp"
#include "curlhttp/logging.hpp"
#include "curlhttp/aux_/curl.hpp"
#include "curlhttp/aux_/scope_end.hpp"
#include "curlhttp/aux_/throw.hpp"

#include <algorithm>
#include <cinttypes>
#include <exception>
#include <string>

namespace curlhttp {

namespace {

	void check_multi_returncode(CURLMcode const result, std::string const& context)
	{
		if (result == CURLM_OK) return;
		// every CURLM error is a programming error, failures of the
		// transfers themselves are reported on the easy handles
		aux::throw_ex<curl_multi_error>(result, context);
	}
}

	multi_handle::multi_handle()
		: multi_handle(global_settings())
	{}

	multi_handle::multi_handle(settings_pack const& sett)
		: m_settings(sett.merged_onto(default_settings()))
	{
		init();
	}

	multi_handle::multi_handle(std::vector<std::shared_ptr<easy_handle>> handles)
		: multi_handle(std::move(handles), global_settings())
	{}

	multi_handle::multi_handle(std::vector<std::shared_ptr<easy_handle>> handles
		, settings_pack const& sett)
		: m_settings(sett.merged_onto(default_settings()))
	{
		init();
		// the caller keeps ownership of the handles if this fails
		auto release = aux::scope_end([this] { detach_all(false); });
		for (auto& h : handles) add_handle(std::move(h));
		release.disarm();
	}

	multi_handle::~multi_handle()
	{
		cleanup();
	}

	void multi_handle::init()
	{
		aux::ensure_global_init();
		m_handle = curl_multi_init();
		if (m_handle == nullptr)
			aux::throw_ex<curl_multi_error>(CURLM_OUT_OF_MEMORY, "curl_multi_init");

		auto release = aux::scope_end([this] { detach_all(false); });

		int const per_host = m_settings.get_int(settings_pack::max_host_connections);
		if (per_host > 0) setopt(CURLMOPT_MAX_HOST_CONNECTIONS, long(per_host));

		int const total = m_settings.get_int(settings_pack::max_total_connections);
		if (total > 0) setopt(CURLMOPT_MAX_TOTAL_CONNECTIONS, long(total));

		release.disarm();
	}

	void multi_handle::detach_all(bool const cleanup_handles) noexcept
	{
		for (auto const& h : m_pool)
		{
			if (m_handle != nullptr && h->valid())
			{
				CURLMcode const ec = curl_multi_remove_handle(m_handle, h->native_handle());
				if (ec != CURLM_OK)
				{
					aux::log(log_level::error, "curl_multi_remove_handle failed: %s"
						, curl_multi_strerror(ec));
				}
			}
			if (cleanup_handles) h->cleanup();
		}
		m_pool.clear();

		if (m_handle == nullptr) return;
		CURLMcode const ec = curl_multi_cleanup(m_handle);
		if (ec != CURLM_OK)
			aux::log(log_level::error, "curl_multi_cleanup failed: %s", curl_multi_strerror(ec));
		m_handle = nullptr;
	}

	void multi_handle::cleanup() noexcept
	{
		detach_all(true);
	}

	void multi_handle::check_valid() const
	{
		if (m_handle == nullptr)
			aux::throw_ex<system_error>(error_code(errors::invalid_handle));
	}

	std::vector<std::shared_ptr<easy_handle>>::iterator multi_handle::find(CURL* native)
	{
		return std::find_if(m_pool.begin(), m_pool.end()
			, [native](std::shared_ptr<easy_handle> const& h)
			{ return h->native_handle() == native; });
	}

	void multi_handle::add_handle(std::shared_ptr<easy_handle> h)
	{
		check_valid();
		if (!h || !h->valid())
			aux::throw_ex<system_error>(error_code(errors::invalid_handle));
		if (find(h->native_handle()) != m_pool.end())
			aux::throw_ex<system_error>(error_code(errors::handle_already_in_pool));

		// make room first, the push_back below must not fail once libcurl
		// has the handle
		m_pool.reserve(m_pool.size() + 1);
		check_multi_returncode(curl_multi_add_handle(m_handle, h->native_handle())
			, "curl_multi_add_handle");
		m_pool.push_back(std::move(h));
	}

	bool multi_handle::remove_handle(handle_id const id)
	{
		auto const i = std::find_if(m_pool.begin(), m_pool.end()
			, [id](std::shared_ptr<easy_handle> const& h) { return h->id() == id; });
		if (i == m_pool.end()) return false;

		// a handle cleaned up while pooled was already removed by libcurl
		if (m_handle != nullptr && (*i)->valid())
		{
			check_multi_returncode(curl_multi_remove_handle(m_handle, (*i)->native_handle())
				, "curl_multi_remove_handle");
		}
		m_pool.erase(i);
		return true;
	}

	bool multi_handle::remove_handle(easy_handle const& h)
	{
		return remove_handle(h.id());
	}

	void multi_handle::setopt(CURLMoption const option, long const value)
	{
		check_valid();
		check_multi_returncode(curl_multi_setopt(m_handle, option, value)
			, "curl_multi_setopt(option=" + std::to_string(option) + ")");
	}

	CURLMcode multi_handle::perform()
	{
		check_valid();
		int const timeout = m_settings.get_int(settings_pack::poll_timeout_ms);

		int still_running = 0;
		for (;;)
		{
			CURLMcode ec = curl_multi_perform(m_handle, &still_running);
			if (ec != CURLM_OK)
			{
				aux::log(log_level::error, "curl_multi_perform failed: (%d) %s"
					, int(ec), curl_multi_strerror(ec));
				return ec;
			}

			if (still_running == 0) break;

			ec = curl_multi_poll(m_handle, nullptr, 0, timeout, nullptr);
			if (ec != CURLM_OK)
			{
				aux::log(log_level::error, "curl_multi_poll failed: (%d) %s"
					, int(ec), curl_multi_strerror(ec));
				return ec;
			}
		}
		return CURLM_OK;
	}

	CURLMcode multi_handle::execute()
	{
		CURLMcode const ret = perform();

		std::exception_ptr first_error;
		int msgs_in_queue = 0;
		for (;;)
		{
			CURLMsg* msg = curl_multi_info_read(m_handle, &msgs_in_queue);
			if (msg == nullptr)
			{
				if (msgs_in_queue > 0)
				{
					aux::log(log_level::error, "curl_multi_info_read returned nothing with %d messages queued"
						, msgs_in_queue);
				}
				break;
			}

			if (msg->msg != CURLMSG_DONE)
			{
				aux::log(log_level::warning, "unknown curl message kind %d", int(msg->msg));
				continue;
			}

			auto const i = find(msg->easy_handle);
			if (i == m_pool.end())
			{
				aux::log(log_level::error, "completion for untracked session %p"
					, static_cast<void*>(msg->easy_handle));
				continue;
			}

			easy_handle& h = **i;
			h.record_result(msg->data.result);
			aux::log(log_level::debug, "handle %" PRIu64 " done: %s (HTTP %ld)"
				, h.id(), curl_easy_strerror(msg->data.result), h.state().http_status.value_or(0));

			std::exception_ptr e = h.finish_transfer();
			if (e && !first_error) first_error = std::move(e);
		}

		if (first_error) std::rethrow_exception(first_error);
		return ret;
	}

	error_code multi_handle::run()
	{
		return execute();
	}

	std::map<handle_id, long> multi_handle::http_statuses() const
	{
		std::map<handle_id, long> ret;
		for (auto const& h : m_pool)
		{
			if (h->state().http_status)
				ret.emplace(h->id(), *h->state().http_status);
		}
		return ret;
	}
}
