/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlhttp/config.hpp"
#include "curlhttp/easy_handle.hpp"
#include "curlhttp/global.hpp"
#include "curlhttp/logging.hpp"
#include "curlhttp/aux_/path.hpp"
#include "curlhttp/aux_/scope_end.hpp"
#include "curlhttp/aux_/throw.hpp"

#include <atomic>
#include <cinttypes>
#include <new>

namespace curlhttp {

namespace {

	std::atomic<handle_id> g_next_handle_id{1};

	handle_id next_handle_id()
	{
		return g_next_handle_id.fetch_add(1, std::memory_order_relaxed);
	}

	// throws if ``path`` is set but does not exist. ``option`` names the
	// parameter in the error message
	void check_path(std::string const& path, errors::error_code_enum const e
		, char const* option)
	{
		if (path.empty()) return;
		error_code ec;
		if (aux::exists(path, ec)) return;
		aux::throw_ex<system_error>(error_code(e)
			, std::string(option) + " `" + path + "'");
	}
}

	char const* method_name(http_method const m)
	{
		switch (m)
		{
			case http_method::get: return "GET";
			case http_method::post: return "POST";
			case http_method::head: return "HEAD";
			case http_method::delete_: return "DELETE";
			case http_method::options: return "OPTIONS";
			case http_method::put: return "PUT";
		}
		return "";
	}

	easy_handle::easy_handle(CURL* h)
		: m_handle(h)
		, m_id(next_handle_id())
		, m_settings(global_settings())
	{
		if (m_handle == nullptr)
			aux::throw_ex<system_error>(error_code(errors::invalid_handle)
				, "adopting a null session");
	}

	easy_handle::easy_handle(easy_params const& p)
		: easy_handle(p, global_settings())
	{}

	easy_handle::easy_handle(easy_params const& p, settings_pack const& sett)
		: m_id(next_handle_id())
		, m_settings(sett.merged_onto(default_settings()))
	{
		configure(p);
	}

	easy_handle::~easy_handle()
	{
		cleanup();
	}

	void easy_handle::configure(easy_params const& p)
	{
		// everything that can be rejected is checked before the session is
		// created
		if (p.method == http_method::put)
			aux::throw_ex<system_error>(error_code(errors::unsupported_method)
				, "Method `PUT'");

		check_path(p.cert_path, errors::cert_file_not_found, "certpath");
		check_path(p.key_path, errors::key_file_not_found, "keypath");

		std::string cainfo = p.cacert_path;
		if (!cainfo.empty())
		{
			check_path(cainfo, errors::cacert_file_not_found, "cacertpath");
		}
		else
		{
			cainfo = m_settings.get_str(settings_pack::ca_cert_path);
			if (!cainfo.empty())
				check_path(cainfo, errors::cacert_file_not_found, "ca_cert_path");
			else
				cainfo = default_ca_bundle();
		}

		aux::ensure_global_init();
		m_handle = curl_easy_init();
		if (m_handle == nullptr)
			aux::throw_ex<curl_easy_error>(CURLE_FAILED_INIT, "curl_easy_init");

		auto release = aux::scope_end([this] { cleanup(); });

		apply_method(p.method);
		m_method = p.method;

		setopt<CURLOPT_FOLLOWLOCATION>(true);
		setopt<CURLOPT_SSL_VERIFYPEER>(true);
		setopt<CURLOPT_SSL_VERIFYHOST>(2L);
		setopt<CURLOPT_SSLVERSION>(long(CURL_SSLVERSION_MAX_TLSv1_3));

		// HTTP/2 over TLS, HTTP/1.1 otherwise. Builds without HTTP/2
		// support only speak HTTP/1.1 anyway
		CURLcode ec = aux::curl_easy_setopt_typechecked<CURLOPT_HTTP_VERSION>(
			m_handle, long(CURL_HTTP_VERSION_2TLS));
		if (ec == CURLE_UNSUPPORTED_PROTOCOL)
			ec = aux::curl_easy_setopt_typechecked<CURLOPT_HTTP_VERSION>(
				m_handle, long(CURL_HTTP_VERSION_1_1));
		if (ec) aux::throw_setopt_error(CURLOPT_HTTP_VERSION, ec, "");

		// fast open defeats connection reuse. A build without it has
		// nothing to turn off
		ec = aux::curl_easy_setopt_typechecked<CURLOPT_TCP_FASTOPEN>(m_handle, 0L);
		if (ec && ec != CURLE_NOT_BUILT_IN && ec != CURLE_UNKNOWN_OPTION)
			aux::throw_setopt_error(CURLOPT_TCP_FASTOPEN, ec, "0");

		setopt<CURLOPT_TCP_KEEPALIVE>(true);
		setopt<CURLOPT_ACCEPT_ENCODING>("");
		setopt<CURLOPT_TRANSFER_ENCODING>(true);
		setopt<CURLOPT_DNS_CACHE_TIMEOUT>(0L);

		bool const verbose = p.verbose.value_or(
			m_settings.get_bool(settings_pack::verbose_logging));
		setopt<CURLOPT_VERBOSE>(verbose);

		if (!p.cert_path.empty()) setopt<CURLOPT_SSLCERT>(p.cert_path);
		if (!p.key_path.empty()) setopt<CURLOPT_SSLKEY>(p.key_path);
		if (!cainfo.empty()) setopt<CURLOPT_CAINFO>(cainfo);

		if (!p.no_user_agent)
		{
			std::optional<std::string> ua = p.user_agent;
			if (!ua && m_settings.has_val(settings_pack::user_agent))
				ua = m_settings.get_str(settings_pack::user_agent);
			if (ua) setopt<CURLOPT_USERAGENT>(*ua);
		}

		if (!p.url.empty()) setopt<CURLOPT_URL>(p.url);

		release.disarm();

		aux::log(log_level::debug, "easy handle %" PRIu64 " created (%s %s)"
			, m_id, method_name(p.method), p.url.c_str());
	}

	void easy_handle::apply_method(http_method const m)
	{
		switch (m)
		{
			case http_method::get:
				setopt<CURLOPT_HTTPGET>(true);
				break;
			case http_method::post:
				// an empty body until setup_request() supplies one, rather
				// than reading the body from stdin
				setopt<CURLOPT_POSTFIELDSIZE>(0L);
				setopt<CURLOPT_POSTFIELDS>("");
				setopt<CURLOPT_POST>(true);
				break;
			case http_method::head:
				setopt<CURLOPT_NOBODY>(true);
				break;
			case http_method::delete_:
				setopt<CURLOPT_HTTPGET>(true);
				setopt<CURLOPT_CUSTOMREQUEST>("DELETE");
				break;
			case http_method::options:
				setopt<CURLOPT_HTTPGET>(true);
				setopt<CURLOPT_CUSTOMREQUEST>("OPTIONS");
				break;
			case http_method::put:
				aux::throw_ex<system_error>(error_code(errors::unsupported_method)
					, "Method `PUT'");
		}
	}

	void easy_handle::reset_body()
	{
		setopt<CURLOPT_POSTFIELDSIZE>(-1L);
		setopt<CURLOPT_POSTFIELDS>(static_cast<char const*>(nullptr));
		if (m_method) apply_method(*m_method);
		else setopt<CURLOPT_HTTPGET>(true);
	}

	void easy_handle::cleanup() noexcept
	{
		if (m_headers != nullptr)
		{
			curl_slist_free_all(m_headers);
			m_headers = nullptr;
		}
		if (m_handle != nullptr)
		{
			curl_easy_cleanup(m_handle);
			m_handle = nullptr;
		}
	}

	void easy_handle::check_valid() const
	{
		if (m_handle == nullptr)
			aux::throw_ex<system_error>(error_code(errors::invalid_handle));
	}

	error_code easy_handle::run()
	{
		return perform();
	}

	CURLcode easy_handle::perform()
	{
		check_valid();
		CURLcode const ret = curl_easy_perform(m_handle);
		record_result(ret);
		std::exception_ptr const e = finish_transfer();
		if (e) std::rethrow_exception(e);
		return ret;
	}

	void easy_handle::add_headers(std::vector<std::string> const& headers
		, bool const append)
	{
		check_valid();
		curl_slist* list = append ? m_headers : nullptr;
		for (auto const& h : headers)
		{
			curl_slist* const tmp = curl_slist_append(list, h.c_str());
			if (tmp == nullptr)
			{
				// the entries appended so far stay attached in append mode
				if (append) m_headers = list;
				else curl_slist_free_all(list);
				aux::throw_ex<std::bad_alloc>();
			}
			list = tmp;
		}

		setopt<CURLOPT_HTTPHEADER>(list);
		if (!append && m_headers != nullptr) curl_slist_free_all(m_headers);
		m_headers = list;
	}

	long easy_handle::response_status() const
	{
		check_valid();
		long status = 0;
		CURLcode const ec = aux::curl_easy_getinfo_typechecked<CURLINFO_RESPONSE_CODE>(
			m_handle, status);
		if (ec) aux::throw_ex<curl_easy_error>(ec, "curl_easy_getinfo (CURLINFO_RESPONSE_CODE)");
		return status;
	}

	std::string easy_handle::error_message() const
	{
		if (!m_state.errors) return {};
		return aux::error_buffer_to_string(m_state.errors->data(), m_state.errors->size());
	}

	std::string easy_handle::escape(std::string const& s) const
	{
		check_valid();
		char* out = curl_easy_escape(m_handle, s.data(), int(s.size()));
		if (out == nullptr) aux::throw_ex<std::bad_alloc>();
		std::string ret(out);
		curl_free(out);
		return ret;
	}

	void easy_handle::record_result(CURLcode const result)
	{
		m_state.result = result;
		m_state.http_status = response_status();
		m_state.error_message = error_message();
	}

	std::exception_ptr easy_handle::finish_transfer()
	{
		std::exception_ptr first;
		auto finish = [&first](std::shared_ptr<response_channel> const& ch
			, std::unique_ptr<channel_consumer>& consumer)
		{
			// dropped if the stream already ended (the header callback
			// pushes one at the blank line) or the consumer stopped
			if (ch) ch->push(end_of_stream{});
			if (!consumer) return;
			std::exception_ptr e = consumer->join();
			consumer.reset();
			if (e && !first) first = std::move(e);
		};
		finish(m_state.data_channel, m_state.data_consumer);
		finish(m_state.header_channel, m_state.header_consumer);
		return first;
	}

	std::string url_escape(std::string const& s)
	{
		aux::ensure_global_init();
		easy_handle scratch(curl_easy_init());
		return scratch.escape(s);
	}
}
