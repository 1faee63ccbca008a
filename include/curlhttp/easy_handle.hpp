/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLHTTP_EASY_HANDLE_HPP_INCLUDED
#define CURLHTTP_EASY_HANDLE_HPP_INCLUDED

#include "curlhttp/config.hpp"
#include "curlhttp/error_code.hpp"
#include "curlhttp/handle.hpp"
#include "curlhttp/settings_pack.hpp"
#include "curlhttp/transfer_state.hpp"
#include "curlhttp/user_data.hpp"
#include "curlhttp/aux_/curl.hpp"

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <vector>

#include <curl/curl.h>

namespace curlhttp {

	enum class http_method : std::uint8_t
	{
		get,
		post,
		head,
		delete_,
		options,
		// recognized, but rejected by the configuring constructor
		put
	};

	CURLHTTP_EXPORT char const* method_name(http_method m);

	// a process-unique identifier assigned to every easy_handle
	using handle_id = std::uint64_t;

	struct easy_params
	{
		// the request target. May be left empty and set later by
		// setup_request()
		std::string url;

		http_method method = http_method::get;

		// when unset, the verbose_logging setting applies
		std::optional<bool> verbose;

		// client certificate, client private key and CA bundle. Each one
		// that is non-empty must name an existing file.
		std::string cert_path;
		std::string key_path;
		std::string cacert_path;

		// when unset, the user_agent setting applies
		std::optional<std::string> user_agent;

		// send no User-Agent header, even if a default is configured
		bool no_user_agent = false;
	};

	// owns one libcurl easy session (CURL*) and the header list attached to
	// it. An easy_handle is driven either by perform(), by execute() or as
	// part of a multi_handle.
	class CURLHTTP_EXPORT easy_handle final : public handle
	{
	public:
		// adopt a session obtained from curl_easy_init(). No options are set
		// on it. The handle takes ownership, ``h`` may not be nullptr.
		explicit easy_handle(CURL* h);

		// create and configure a session, reading defaults from
		// global_settings(). Throws system_error for an unsupported method
		// or a cert, key or CA path that does not exist. In that case no
		// session is created.
		explicit easy_handle(easy_params const& p);
		easy_handle(easy_params const& p, settings_pack const& sett);

		~easy_handle() override;

		easy_handle(easy_handle&&) = delete;
		easy_handle& operator=(easy_handle&&) = delete;

		// frees the header list and the session
		void cleanup() noexcept override;

		// perform() as an error_code in curl_category()
		error_code run() override;

		bool valid() const noexcept override { return m_handle != nullptr; }

		// perform the transfer in the calling thread. Once it completes,
		// end_of_stream is published to the response channels and their
		// consumers are joined. An exception thrown by a response handler is
		// rethrown here.
		CURLcode perform();

		[[nodiscard]] CURL* native_handle() const noexcept { return m_handle; }
		[[nodiscard]] handle_id id() const noexcept { return m_id; }

		// the method the handle was configured with. Adopted sessions have
		// none.
		[[nodiscard]] std::optional<http_method> method() const noexcept { return m_method; }

		template<CURLoption option>
		void setopt(bool value);

		template<CURLoption option, typename T>
		void setopt(T const& value);

		// replace the request headers with ``headers``, or with ``append``
		// add them to the ones already set
		void add_headers(std::vector<std::string> const& headers, bool append = false);

		// CURLINFO_RESPONSE_CODE of the last transfer, 0 if nothing was
		// received
		[[nodiscard]] long response_status() const;

		// the text in the error buffer, empty if there is no error buffer
		// or the last transfer succeeded
		[[nodiscard]] std::string error_message() const;

		// percent-encode ``s`` for use in a URL
		[[nodiscard]] std::string escape(std::string const& s) const;

		transfer_state& state() { return m_state; }
		transfer_state const& state() const { return m_state; }

		user_data& userdata() { return m_userdata; }
		user_data const& userdata() const { return m_userdata; }

		// publish end_of_stream to the response channels and wait for their
		// consumers. Returns the first exception thrown by a handler.
		std::exception_ptr finish_transfer();

		// record the outcome of a transfer in state()
		void record_result(CURLcode result);

		// drop the request body set by an earlier setup_request() and
		// restore the handle's method
		void reset_body();

		// the settings the handle was configured with
		settings_pack const& settings() const { return m_settings; }

	private:

		void check_valid() const;
		void configure(easy_params const& p);
		void apply_method(http_method m);

		// the libcurl session. nullptr after cleanup()
		CURL* m_handle = nullptr;

		// the list passed as CURLOPT_HTTPHEADER, owned by this handle
		curl_slist* m_headers = nullptr;

		handle_id const m_id;

		std::optional<http_method> m_method;

		settings_pack m_settings;

		transfer_state m_state;
		user_data m_userdata;
	};

	template<CURLoption option>
	void easy_handle::setopt(bool const value)
	{
		setopt<option, long>(value ? 1L : 0L);
	}

	template<CURLoption option, typename T>
	void easy_handle::setopt(T const& value)
	{
		check_valid();
		auto const error = aux::curl_easy_setopt_typechecked<option>(m_handle, value);
		if (!error) return;
		aux::throw_setopt_error(option, error, aux::setopt_value_str(value));
	}

	// percent-encode ``s`` using a scratch session
	CURLHTTP_EXPORT std::string url_escape(std::string const& s);
}

#endif
