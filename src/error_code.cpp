/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlhttp/config.hpp"
#include "curlhttp/error_code.hpp"

#include <string>

namespace curlhttp {

	struct curlhttp_error_category final : boost::system::error_category
	{
		const char* name() const BOOST_SYSTEM_NOEXCEPT override;
		std::string message(int ev) const override;
		boost::system::error_condition default_error_condition(int ev) const BOOST_SYSTEM_NOEXCEPT override
		{ return {ev, *this}; }
	};

	const char* curlhttp_error_category::name() const BOOST_SYSTEM_NOEXCEPT
	{
		return "curlhttp";
	}

	std::string curlhttp_error_category::message(int ev) const
	{
		static char const* msgs[] =
		{
			"no error",
			"HTTP method is not currently supported",
			"could not find the client certificate file",
			"could not find the client key file",
			"could not find the CA certificate bundle",
			"the handle has been cleaned up",
			"the handle is already part of the pool",
		};
		if (ev < 0 || ev >= int(sizeof(msgs)/sizeof(msgs[0])))
			return "Unknown error";
		return msgs[ev];
	}

	struct curl_error_category final : boost::system::error_category
	{
		const char* name() const BOOST_SYSTEM_NOEXCEPT override
		{ return "curl"; }
		std::string message(int ev) const override
		{ return curl_easy_strerror(static_cast<CURLcode>(ev)); }
		boost::system::error_condition default_error_condition(int ev) const BOOST_SYSTEM_NOEXCEPT override
		{ return {ev, *this}; }
	};

	struct curl_multi_error_category final : boost::system::error_category
	{
		const char* name() const BOOST_SYSTEM_NOEXCEPT override
		{ return "curl multi"; }
		std::string message(int ev) const override
		{ return curl_multi_strerror(static_cast<CURLMcode>(ev)); }
		boost::system::error_condition default_error_condition(int ev) const BOOST_SYSTEM_NOEXCEPT override
		{ return {ev, *this}; }
	};

	boost::system::error_category& curlhttp_category()
	{
		static curlhttp_error_category curlhttp_category;
		return curlhttp_category;
	}

	boost::system::error_category& curl_category()
	{
		static curl_error_category curl_category;
		return curl_category;
	}

	boost::system::error_category& curl_multi_category()
	{
		static curl_multi_error_category curl_multi_category;
		return curl_multi_category;
	}

	namespace errors
	{
		boost::system::error_code make_error_code(error_code_enum e)
		{
			return {e, curlhttp_category()};
		}
	}
}

boost::system::error_code make_error_code(CURLcode const e)
{
	return {static_cast<int>(e), curlhttp::curl_category()};
}

boost::system::error_code make_error_code(CURLMcode const e)
{
	return {static_cast<int>(e), curlhttp::curl_multi_category()};
}
