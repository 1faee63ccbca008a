/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLHTTP_ERROR_CODE_HPP_INCLUDED
#define CURLHTTP_ERROR_CODE_HPP_INCLUDED

#include "curlhttp/config.hpp"

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <curl/curl.h>

#include <stdexcept>
#include <string>

namespace curlhttp {

	namespace errors
	{
		// curlhttp uses boost.system's ``error_code`` class to represent
		// errors. curlhttp has its own error category curlhttp_category()
		// with the error codes defined by error_code_enum.
		enum error_code_enum
		{
			// Not an error
			no_error = 0,
			// The HTTP method is recognized but not supported (PUT)
			unsupported_method,
			// The client certificate file (certpath) does not exist
			cert_file_not_found,
			// The client private key file (keypath) does not exist
			key_file_not_found,
			// The CA bundle (cacertpath) does not exist
			cacert_file_not_found,
			// The operation requires a handle that has not been cleaned up
			invalid_handle,
			// The handle is already a member of the multi handle's pool
			handle_already_in_pool,

			// the number of error codes
			error_code_max
		};

		// hidden
		CURLHTTP_EXPORT boost::system::error_code make_error_code(error_code_enum e);
	}

	// return the instance of the curlhttp error category which maps curlhttp
	// error codes to human readable error messages.
	CURLHTTP_EXPORT boost::system::error_category& curlhttp_category();

	// the category for CURLcode values returned by easy transfers. Messages
	// come from curl_easy_strerror().
	CURLHTTP_EXPORT boost::system::error_category& curl_category();

	// the category for CURLMcode values returned by the multi interface.
	// Messages come from curl_multi_strerror().
	CURLHTTP_EXPORT boost::system::error_category& curl_multi_category();

	using boost::system::error_code;
	using boost::system::error_condition;
	using boost::system::system_error;

	// thrown when a curl_easy_* call that is not expected to fail does.
	// These indicate misuse of the engine (wrong option type, out of memory)
	// rather than a failed transfer.
	class CURLHTTP_EXPORT curl_easy_error : public std::runtime_error
	{
	public:
		curl_easy_error(CURLcode ec, std::string const& prefix)
			: std::runtime_error(prefix + ": " + curl_easy_strerror(ec))
			, m_code(ec)
		{}

		[[nodiscard]] CURLcode code() const noexcept { return m_code; }

	private:
		CURLcode m_code;
	};

	// the multi-interface counterpart of curl_easy_error
	class CURLHTTP_EXPORT curl_multi_error : public std::runtime_error
	{
	public:
		curl_multi_error(CURLMcode ec, std::string const& prefix)
			: std::runtime_error(prefix + ": " + curl_multi_strerror(ec))
			, m_code(ec)
		{}

		[[nodiscard]] CURLMcode code() const noexcept { return m_code; }

	private:
		CURLMcode m_code;
	};
}

// CURLcode and CURLMcode are declared in the global namespace, so are their
// make_error_code() overloads, for argument dependent lookup to find them
CURLHTTP_EXPORT boost::system::error_code make_error_code(CURLcode e);
CURLHTTP_EXPORT boost::system::error_code make_error_code(CURLMcode e);

namespace boost { namespace system {

	template<> struct is_error_code_enum<curlhttp::errors::error_code_enum>
	{ static const bool value = true; };

	template<> struct is_error_code_enum<CURLcode>
	{ static const bool value = true; };

	template<> struct is_error_code_enum<CURLMcode>
	{ static const bool value = true; };
} }

#endif // CURLHTTP_ERROR_CODE_HPP_INCLUDED
