/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlhttp/config.hpp"
#include "curlhttp/error_code.hpp"
#include "curlhttp/aux_/curl.hpp"
#include "curlhttp/aux_/throw.hpp"

#include <cstring>
#include <new>

namespace curlhttp::aux {

namespace {

	std::string curl_easy_option_str(CURLoption const option)
	{
		curl_easyoption const* opt = curl_easy_option_by_id(option);
		if (opt == nullptr || opt->name == nullptr)
			return "option " + std::to_string(int(option));
		return std::string("CURLOPT_") + opt->name;
	}
}

	void throw_setopt_error(CURLoption const option, CURLcode const error
		, std::string const& value)
	{
		if (error == CURLE_OUT_OF_MEMORY)
			throw_ex<std::bad_alloc>();

		std::string context = "setting " + curl_easy_option_str(option);
		if (error == CURLE_BAD_FUNCTION_ARGUMENT && !value.empty())
			context += " to '" + value + "'";
		throw_ex<curl_easy_error>(error, context);
	}

	std::string error_buffer_to_string(char const* buf, std::size_t const size)
	{
		if (buf == nullptr) return {};
		void const* nul = std::memchr(buf, '\0', size);
		if (nul == nullptr) return std::string(buf, size);
		return std::string(buf, static_cast<char const*>(nul));
	}
}
