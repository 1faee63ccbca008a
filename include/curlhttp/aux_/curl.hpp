/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLHTTP_AUX_CURL_HPP_INCLUDED
#define CURLHTTP_AUX_CURL_HPP_INCLUDED

#include "curlhttp/config.hpp"

#include <cstddef>
#include <string>
#include <type_traits>

#include <curl/curl.h>

namespace curlhttp::aux {

template <typename>
inline constexpr bool dependent_false = false;

// Making `option` a compile time constant allows the option's type to be
// verified against the value (curl's own typechecker only works for C)

template<CURLoption option>
CURLcode curl_easy_setopt_typechecked(CURL* easy_handle, const long value)
{
	static_assert(option >= CURLOPTTYPE_LONG && option < CURLOPTTYPE_OBJECTPOINT);
	return curl_easy_setopt(easy_handle, option, value);
}

// char*, curl_slist*, function pointers, callback data (void*)
template<CURLoption option, typename T, typename = std::enable_if_t<std::is_pointer_v<T>>>
CURLcode curl_easy_setopt_typechecked(CURL* easy_handle, const T value)
{
	static_assert(option >= CURLOPTTYPE_OBJECTPOINT && option < CURLOPTTYPE_OFF_T);
	return curl_easy_setopt(easy_handle, option, value);
}

template<CURLoption option>
CURLcode curl_easy_setopt_typechecked(CURL* easy_handle, const std::string& value)
{
	static_assert(option >= CURLOPTTYPE_OBJECTPOINT && option < CURLOPTTYPE_FUNCTIONPOINT);
	return curl_easy_setopt_typechecked<option>(easy_handle, value.c_str());
}

template<CURLINFO info, typename T>
CURLcode curl_easy_getinfo_typechecked(CURL* easy_handle, T& value)
{
	using basic_type = std::decay_t<T>;
	constexpr auto info_type = info & CURLINFO_TYPEMASK;

	if constexpr (info_type == CURLINFO_STRING)
	{
		static_assert(std::is_same_v<basic_type, const char *> || std::is_same_v<basic_type, char *>);
	}
	else if constexpr (info_type == CURLINFO_SLIST)
	{
		static_assert(std::is_pointer_v<basic_type>);
	}
	else if constexpr (info_type == CURLINFO_OFF_T)
	{
		static_assert(std::is_same_v<basic_type, curl_off_t>);
	}
	else if constexpr (info_type == CURLINFO_LONG)
	{
		static_assert(std::is_same_v<basic_type, long>);
	}
	else if constexpr (info_type == CURLINFO_SOCKET)
	{
		static_assert(std::is_same_v<basic_type, curl_socket_t>);
	}
	else if constexpr (info_type == CURLINFO_DOUBLE)
	{
		static_assert(std::is_same_v<basic_type, double>);
	}
	else
	{
		// this triggers if new types are added and used.
		static_assert(dependent_false<T>);
	}

	return curl_easy_getinfo(easy_handle, info, &value);
}

// throws curl_easy_error (or std::bad_alloc) describing a failed
// curl_easy_setopt() call. ``value`` is included in the message when libcurl
// rejected it as a bad argument.
[[noreturn]] CURLHTTP_EXTRA_EXPORT void throw_setopt_error(CURLoption option
	, CURLcode error, std::string const& value);

template <typename T>
std::string setopt_value_str(T const& value)
{
	using basic_type = std::decay_t<T>;
	if constexpr (std::is_array_v<T>)
		return std::string(value);
	else if constexpr (std::is_integral_v<basic_type>)
		return std::to_string(value);
	else if constexpr (std::is_same_v<basic_type, std::string>)
		return value;
	else if constexpr (std::is_same_v<basic_type, char *>
		|| std::is_same_v<basic_type, const char *>)
		return value == nullptr ? std::string() : std::string(value);
	else
		return {};
}

// the text of an error buffer filled in by CURLOPT_ERRORBUFFER, up to the
// first NUL. If there is no NUL, the whole buffer.
CURLHTTP_EXTRA_EXPORT std::string error_buffer_to_string(char const* buf, std::size_t size);

// calls curl_global_init() exactly once per process
CURLHTTP_EXTRA_EXPORT void ensure_global_init();
}

#endif
