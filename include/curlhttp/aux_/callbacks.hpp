/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLHTTP_CALLBACKS_HPP_INCLUDED
#define CURLHTTP_CALLBACKS_HPP_INCLUDED

#include "curlhttp/config.hpp"

#include <cstddef>

#include <curl/curl.h>

// the functions installed as CURLOPT_WRITEFUNCTION, CURLOPT_HEADERFUNCTION
// and CURLOPT_DEBUGFUNCTION. They are called by libcurl, from within
// curl_easy_perform() or curl_multi_perform(), and must not throw.
namespace curlhttp::aux {

	// ``userdata`` is the response_channel* set as CURLOPT_WRITEDATA. The
	// chunk is copied onto the channel. Returns 0, which aborts the
	// transfer, if the channel's consumer has failed.
	CURLHTTP_EXTRA_EXPORT std::size_t write_callback(char* ptr, std::size_t size
		, std::size_t nmemb, void* userdata);

	// ``userdata`` is the response_channel* set as CURLOPT_HEADERDATA. The
	// blank line terminating the header block is published as
	// end_of_stream.
	CURLHTTP_EXTRA_EXPORT std::size_t header_callback(char* buffer, std::size_t size
		, std::size_t nitems, void* userdata);

	// accepts and drops response data when no channel is set up
	CURLHTTP_EXTRA_EXPORT std::size_t discard_callback(char* ptr, std::size_t size
		, std::size_t nmemb, void* userdata);

	// logs informational text, headers and TLS traffic at log_level::info.
	// libcurl only calls it when CURLOPT_VERBOSE is set. ``userptr`` is the
	// easy_handle.
	CURLHTTP_EXTRA_EXPORT int debug_callback(CURL* h, curl_infotype type
		, char* data, std::size_t size, void* userptr);
}

#endif
