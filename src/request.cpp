/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlhttp/config.hpp"
#include "curlhttp/request.hpp"
#include "curlhttp/logging.hpp"
#include "curlhttp/aux_/callbacks.hpp"

#include <cinttypes>
#include <new>

namespace curlhttp {

namespace aux {

	std::size_t write_callback(char* ptr, std::size_t const size
		, std::size_t const nmemb, void* userdata)
	{
		auto* ch = static_cast<response_channel*>(userdata);
		std::size_t const n = size * nmemb;
		try
		{
			if (ch->push(data_chunk{std::vector<char>(ptr, ptr + n)}))
				return n;
		}
		catch (std::bad_alloc const&)
		{
			return 0;
		}

		// a short count makes libcurl fail the transfer with
		// CURLE_WRITE_ERROR
		if (ch->failed()) return 0;

		// the consumer already saw end_of_stream
		return n;
	}

	std::size_t header_callback(char* buffer, std::size_t const size
		, std::size_t const nitems, void* userdata)
	{
		auto* ch = static_cast<response_channel*>(userdata);
		std::size_t const n = size * nitems;
		try
		{
			std::string line(buffer, n);
			stream_item item = line == "\r\n"
				? stream_item(end_of_stream{})
				: stream_item(header_line{std::move(line)});
			if (ch->push(std::move(item)))
				return n;
		}
		catch (std::bad_alloc const&)
		{
			return 0;
		}

		if (ch->failed()) return 0;

		// header blocks following the first one (redirects, 100 Continue)
		// are dropped
		return n;
	}

	std::size_t discard_callback(char*, std::size_t const size
		, std::size_t const nmemb, void*)
	{
		return size * nmemb;
	}

	int debug_callback(CURL*, curl_infotype const type
		, char* data, std::size_t size, void* userptr)
	{
		switch (type)
		{
			case CURLINFO_TEXT:
			case CURLINFO_HEADER_IN:
			case CURLINFO_HEADER_OUT:
			case CURLINFO_SSL_DATA_IN:
			case CURLINFO_SSL_DATA_OUT:
				break;
			default:
				return 0;
		}

		if (!should_log(log_level::info)) return 0;

		while (size > 0 && (data[size - 1] == '\n' || data[size - 1] == '\r'))
			--size;

		auto const* h = static_cast<easy_handle const*>(userptr);
		log(log_level::info, "[%" PRIu64 "] %.*s"
			, h == nullptr ? handle_id(0) : h->id(), int(size), data);
		return 0;
	}
}

namespace {

	std::shared_ptr<response_channel> make_channel(easy_handle const& h)
	{
		auto ch = std::make_shared<response_channel>(
			h.settings().get_int(settings_pack::channel_capacity));
		aux::log(log_level::debug, "handle %" PRIu64 " created channel %p"
			, h.id(), static_cast<void*>(ch.get()));
		return ch;
	}
}

	void setup_request(easy_handle& h, std::string const& body
		, std::vector<std::string> const& headers
		, request_options const& options)
	{
		transfer_state& st = h.state();

		// the handle owns every channel libcurl points at, including when
		// one of the calls below throws
		st.data_channel = options.data_channel;
		st.header_channel = options.header_channel;

		if (options.data_channel)
		{
			h.setopt<CURLOPT_WRITEFUNCTION>(&aux::write_callback);
			h.setopt<CURLOPT_WRITEDATA>(static_cast<void*>(options.data_channel.get()));
		}
		else
		{
			h.setopt<CURLOPT_WRITEFUNCTION>(&aux::discard_callback);
			h.setopt<CURLOPT_WRITEDATA>(static_cast<void*>(nullptr));
		}

		if (options.header_channel)
		{
			h.setopt<CURLOPT_HEADERFUNCTION>(&aux::header_callback);
			h.setopt<CURLOPT_HEADERDATA>(static_cast<void*>(options.header_channel.get()));
		}
		else
		{
			h.setopt<CURLOPT_HEADERFUNCTION>(&aux::discard_callback);
			h.setopt<CURLOPT_HEADERDATA>(static_cast<void*>(nullptr));
		}

		if (options.url) h.setopt<CURLOPT_URL>(*options.url);

		h.add_headers(headers, options.append_headers);
		std::vector<std::string> sent;
		if (options.append_headers) sent = st.request_headers;
		sent.insert(sent.end(), headers.begin(), headers.end());

		if (!body.empty())
		{
			// the size must be set first, COPYPOSTFIELDS copies that many
			// bytes
			h.setopt<CURLOPT_POSTFIELDSIZE>(long(body.size()));
			h.setopt<CURLOPT_COPYPOSTFIELDS>(body);

			std::string content_length = "Content-Length: " + std::to_string(body.size());
			h.add_headers({content_length}, true);
			sent.push_back(std::move(content_length));
		}
		else if (!st.request_body.empty())
		{
			h.reset_body();
		}

		h.setopt<CURLOPT_DEBUGFUNCTION>(&aux::debug_callback);
		h.setopt<CURLOPT_DEBUGDATA>(static_cast<void*>(&h));

		auto errors = std::make_unique<error_buffer>();
		h.setopt<CURLOPT_ERRORBUFFER>(errors->data());

		// libcurl no longer refers to anything held by the previous request
		st.errors = std::move(errors);
		st.request_body = body;
		st.request_headers = std::move(sent);
		st.result.reset();
		st.http_status.reset();
		st.error_message.reset();
	}

	void setup_request_response(easy_handle& h, std::string const& body
		, std::vector<std::string> const& headers
		, response_options options)
	{
		transfer_state& st = h.state();

		// consumers left over from a request that was set up but never
		// performed
		st.data_consumer.reset();
		st.header_consumer.reset();
		st.data_buffer.reset();
		st.response_headers.reset();

		if (!options.on_data)
		{
			st.data_buffer.emplace();
			std::vector<char>* buf = &*st.data_buffer;
			options.on_data = [buf](std::vector<char> const& d)
			{ buf->insert(buf->end(), d.begin(), d.end()); };
		}

		if (!options.on_header)
		{
			st.response_headers.emplace();
			std::vector<std::string>* buf = &*st.response_headers;
			options.on_header = [buf](std::string const& l) { buf->push_back(l); };
		}

		request_options ropts;
		ropts.url = std::move(options.url);

		if (*options.on_data)
			ropts.data_channel = make_channel(h);
		if (*options.on_header)
			ropts.header_channel = make_channel(h);

		setup_request(h, body, headers, ropts);

		if (ropts.data_channel)
		{
			st.data_consumer = std::make_unique<channel_consumer>(ropts.data_channel
				, [on_data = std::move(*options.on_data)](stream_item& item)
				{
					auto const& chunk = std::get<data_chunk>(item);
					aux::log(log_level::debug, "received %d bytes", int(chunk.bytes.size()));
					on_data(chunk.bytes);
				});
		}

		if (ropts.header_channel)
		{
			st.header_consumer = std::make_unique<channel_consumer>(ropts.header_channel
				, [on_header = std::move(*options.on_header)](stream_item& item)
				{ on_header(std::get<header_line>(item).text); });
		}
	}

	transfer_result execute(easy_handle& h, std::string const& body
		, std::vector<std::string> const& headers
		, response_options options)
	{
		setup_request_response(h, body, headers, std::move(options));

		transfer_result ret;
		ret.code = h.perform();
		ret.http_status = h.state().http_status.value_or(0);
		ret.error_message = h.state().error_message.value_or(std::string());
		return ret;
	}

	transfer_result execute(easy_handle& h, data_handler on_data
		, std::string const& body
		, std::vector<std::string> const& headers
		, std::optional<std::string> url)
	{
		response_options options;
		options.on_data = std::move(on_data);
		options.on_header = header_handler();
		options.url = std::move(url);
		return execute(h, body, headers, std::move(options));
	}
}
