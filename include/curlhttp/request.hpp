/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLHTTP_REQUEST_HPP_INCLUDED
#define CURLHTTP_REQUEST_HPP_INCLUDED

#include "curlhttp/config.hpp"
#include "curlhttp/easy_handle.hpp"
#include "curlhttp/response_channel.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <curl/curl.h>

namespace curlhttp {

	// called once per chunk of response body, in arrival order
	using data_handler = std::function<void(std::vector<char> const&)>;

	// called once per response header line. The line includes its CRLF
	// terminator
	using header_handler = std::function<void(std::string const&)>;

	struct request_options
	{
		// if set, response body chunks are pushed onto this channel
		std::shared_ptr<response_channel> data_channel;

		// if set, response header lines are pushed onto this channel
		std::shared_ptr<response_channel> header_channel;

		// replaces the handle's URL
		std::optional<std::string> url;

		// add the headers to the ones already attached instead of
		// replacing them
		bool append_headers = false;
	};

	// configure ``h`` for its next transfer. The header list is replaced
	// (unless options.append_headers). A non-empty ``body`` is sent as the
	// request body along with a Content-Length header. The channels, the
	// error buffer and the debug callback are installed and recorded in
	// h.state().
	//
	// The header channel receives the lines of the first header block and
	// then end_of_stream. Later blocks, such as the final response after a
	// followed redirect or the one after a 100 Continue, are dropped. The
	// data channel receives end_of_stream once the transfer completes.
	CURLHTTP_EXPORT void setup_request(easy_handle& h, std::string const& body
		, std::vector<std::string> const& headers
		, request_options const& options = {});

	struct response_options
	{
		// std::nullopt installs the default handler, which appends to
		// transfer_state::data_buffer. An empty function disables capturing
		// the body altogether.
		std::optional<data_handler> on_data;

		// std::nullopt installs the default handler, which appends to
		// transfer_state::response_headers. An empty function disables
		// capturing headers altogether.
		std::optional<header_handler> on_header;

		std::optional<std::string> url;
	};

	// like setup_request(), but creates a channel and a consumer thread for
	// each handler
	CURLHTTP_EXPORT void setup_request_response(easy_handle& h, std::string const& body
		, std::vector<std::string> const& headers
		, response_options options = {});

	struct transfer_result
	{
		CURLcode code = CURLE_OK;
		long http_status = 0;

		// the text libcurl left in the error buffer. Empty on success
		std::string error_message;
	};

	// set up and perform a single transfer on ``h``. Transfer errors are
	// reported in the returned code and message. An exception thrown by a
	// handler is rethrown once the transfer has completed.
	CURLHTTP_EXPORT transfer_result execute(easy_handle& h
		, std::string const& body = {}
		, std::vector<std::string> const& headers = {}
		, response_options options = {});

	// the form taking the body handler first. Response headers are not
	// captured.
	CURLHTTP_EXPORT transfer_result execute(easy_handle& h
		, data_handler on_data
		, std::string const& body = {}
		, std::vector<std::string> const& headers = {}
		, std::optional<std::string> url = std::nullopt);
}

#endif
