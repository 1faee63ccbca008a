/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLHTTP_MULTI_HANDLE_HPP_INCLUDED
#define CURLHTTP_MULTI_HANDLE_HPP_INCLUDED

#include "curlhttp/config.hpp"
#include "curlhttp/easy_handle.hpp"
#include "curlhttp/error_code.hpp"
#include "curlhttp/handle.hpp"
#include "curlhttp/settings_pack.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <vector>

#include <curl/curl.h>

namespace curlhttp {

	// owns a libcurl multi session and the pool of easy handles added to it.
	// Every handle in the pool is registered with the multi session, adding
	// and removing keep the two in step.
	class CURLHTTP_EXPORT multi_handle final : public handle
	{
	public:
		multi_handle();
		explicit multi_handle(settings_pack const& sett);

		// add each handle in turn
		explicit multi_handle(std::vector<std::shared_ptr<easy_handle>> handles);
		multi_handle(std::vector<std::shared_ptr<easy_handle>> handles
			, settings_pack const& sett);

		~multi_handle() override;

		multi_handle(multi_handle&&) = delete;
		multi_handle& operator=(multi_handle&&) = delete;

		// removes every pooled handle and cleans it up, then releases the
		// multi session
		void cleanup() noexcept override;

		// execute() as an error_code in curl_multi_category()
		error_code run() override;

		bool valid() const noexcept override { return m_handle != nullptr; }

		// throws system_error if ``h`` is already pooled or has been cleaned
		// up, and curl_multi_error if libcurl rejects it. The pool is left
		// unchanged in either case.
		void add_handle(std::shared_ptr<easy_handle> h);

		// remove a handle from the pool and the multi session, without
		// cleaning it up. Returns false if it is not in the pool.
		bool remove_handle(easy_handle const& h);
		bool remove_handle(handle_id id);

		// drive every pooled transfer until none is running. Each wait is
		// bounded by the poll_timeout_ms setting. A failure of
		// curl_multi_perform() or curl_multi_poll() is logged and returned
		// immediately.
		CURLMcode perform();

		// perform(), then record the outcome of every completed transfer in
		// its handle's transfer_state and wait for the response consumers.
		// The return value is that of perform(). An exception thrown by a
		// response handler is rethrown once every completion has been
		// recorded.
		CURLMcode execute();

		void setopt(CURLMoption option, long value);

		// the recorded HTTP status of every pooled handle that has one
		std::map<handle_id, long> http_statuses() const;

		std::vector<std::shared_ptr<easy_handle>> const& pool() const { return m_pool; }
		std::size_t size() const { return m_pool.size(); }

		// the settings the multi session was configured with
		settings_pack const& settings() const { return m_settings; }

		[[nodiscard]] CURLM* native_handle() const noexcept { return m_handle; }

	private:

		void init();
		void check_valid() const;
		// remove every pooled handle, optionally cleaning it up, and release
		// the multi session
		void detach_all(bool cleanup_handles) noexcept;
		std::vector<std::shared_ptr<easy_handle>>::iterator find(CURL* native);

		CURLM* m_handle = nullptr;
		std::vector<std::shared_ptr<easy_handle>> m_pool;
		settings_pack m_settings;
	};
}

#endif
