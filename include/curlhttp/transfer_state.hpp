/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLHTTP_TRANSFER_STATE_HPP_INCLUDED
#define CURLHTTP_TRANSFER_STATE_HPP_INCLUDED

#include "curlhttp/config.hpp"
#include "curlhttp/response_channel.hpp"

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <curl/curl.h>

namespace curlhttp {

	using error_buffer = std::array<char, CURL_ERROR_SIZE>;

	// the bookkeeping an easy_handle carries for the request currently set
	// up on it. setup_request() and setup_request_response() overwrite it,
	// and the completion of a transfer fills in http_status and
	// error_message.
	//
	// None of these fields may be touched while the handle is being
	// performed, except for the buffers, which belong to the consumer
	// threads until perform() or execute() returns.
	struct transfer_state
	{
		// the request headers last passed to setup_request()
		std::vector<std::string> request_headers;

		// the request body last passed to setup_request()
		std::string request_body;

		// installed as CURLOPT_ERRORBUFFER. libcurl writes a NUL-terminated
		// message into it when a transfer fails
		std::unique_ptr<error_buffer> errors;

		std::shared_ptr<response_channel> data_channel;
		std::shared_ptr<response_channel> header_channel;

		// the response body, filled in by the default data handler
		std::optional<std::vector<char>> data_buffer;

		// the response header lines (without the terminating blank line),
		// filled in by the default header handler. Only the first header
		// block is kept. When a redirect was followed these are the 3xx
		// response's headers, while http_status is the final response's.
		std::optional<std::vector<std::string>> response_headers;

		// recorded when the transfer completes
		std::optional<CURLcode> result;
		std::optional<long> http_status;
		std::optional<std::string> error_message;

		// the threads draining data_channel and header_channel
		std::unique_ptr<channel_consumer> data_consumer;
		std::unique_ptr<channel_consumer> header_consumer;

		// the data buffer as a string, or the empty string if there is none
		std::string body() const
		{
			if (!data_buffer) return {};
			return std::string(data_buffer->begin(), data_buffer->end());
		}
	};
}

#endif
