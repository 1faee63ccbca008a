/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "web_server.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/completion_condition.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using boost::system::error_code;

namespace {

std::string to_lower(std::string s)
{
	std::transform(s.begin(), s.end(), s.begin()
		, [](unsigned char c) { return char(std::tolower(c)); });
	return s;
}

std::string trim(std::string const& s)
{
	auto const first = s.find_first_not_of(" \t\r\n");
	if (first == std::string::npos) return {};
	auto const last = s.find_last_not_of(" \t\r\n");
	return s.substr(first, last - first + 1);
}

struct request
{
	std::string method;
	std::string target;
	std::string path;
	std::vector<std::string> args;
	// as sent, "Name: value"
	std::vector<std::string> header_lines;
	std::string body;
	std::size_t content_length = 0;
	bool expect_continue = false;
	bool close = false;
};

bool parse_request(std::string const& head, request& req)
{
	std::istringstream in(head);
	std::string line;
	if (!std::getline(in, line)) return false;
	line = trim(line);

	std::istringstream request_line(line);
	std::string version;
	request_line >> req.method >> req.target >> version;
	if (req.method.empty() || req.target.empty()) return false;

	auto const q = req.target.find('?');
	req.path = req.target.substr(0, q);
	if (q != std::string::npos)
	{
		std::string const query = req.target.substr(q + 1);
		std::size_t start = 0;
		while (start <= query.size())
		{
			auto const amp = query.find('&', start);
			std::string arg = query.substr(start
				, amp == std::string::npos ? std::string::npos : amp - start);
			if (!arg.empty()) req.args.push_back(std::move(arg));
			if (amp == std::string::npos) break;
			start = amp + 1;
		}
	}

	while (std::getline(in, line))
	{
		line = trim(line);
		if (line.empty()) continue;
		auto const colon = line.find(':');
		if (colon == std::string::npos) continue;
		req.header_lines.push_back(line);

		std::string const name = to_lower(line.substr(0, colon));
		std::string const value = to_lower(trim(line.substr(colon + 1)));
		if (name == "content-length")
			req.content_length = std::size_t(std::strtoull(value.c_str(), nullptr, 10));
		else if (name == "expect" && value == "100-continue")
			req.expect_continue = true;
		else if (name == "connection" && value == "close")
			req.close = true;
	}
	return true;
}

char const* reason_phrase(int const code)
{
	switch (code)
	{
		case 200: return "OK";
		case 201: return "Created";
		case 204: return "No Content";
		case 301: return "Moved Permanently";
		case 302: return "Found";
		case 400: return "Bad Request";
		case 403: return "Forbidden";
		case 404: return "Not Found";
		case 500: return "Internal Server Error";
		case 503: return "Service Unavailable";
		default: return "Unknown";
	}
}

std::string build_response(request const& req)
{
	int status = 200;
	std::string body;
	std::string extra_headers;
	bool send_body = req.method != "HEAD";

	if (req.method == "OPTIONS")
	{
		extra_headers = "Allow: GET, POST, HEAD, DELETE, OPTIONS\r\n";
	}
	else if (req.path == "/empty")
	{
	}
	else if (req.path.compare(0, 7, "/large/") == 0)
	{
		std::size_t const n = std::size_t(std::strtoull(req.path.c_str() + 7, nullptr, 10));
		body.resize(n);
		for (std::size_t i = 0; i < n; ++i) body[i] = large_body_byte(i);
	}
	else if (req.path == "/redirect")
	{
		status = 302;
		extra_headers = "Location: /echo?redirected=1\r\n";
		body = "moved\n";
	}
	else if (req.path.compare(0, 8, "/status/") == 0)
	{
		status = std::atoi(req.path.c_str() + 8);
		if (status < 200 || status > 599) status = 400;
		body = "status " + std::to_string(status) + "\n";
	}
	else
	{
		body += "method: " + req.method + "\n";
		body += "target: " + req.target + "\n";
		body += "path: " + req.path + "\n";
		for (auto const& a : req.args) body += "arg: " + a + "\n";
		for (auto const& h : req.header_lines) body += "header: " + h + "\n";
		body += "body: " + req.body + "\n";
	}

	std::string ret = "HTTP/1.1 " + std::to_string(status) + " " + reason_phrase(status) + "\r\n";
	ret += "Content-Type: text/plain\r\n";
	ret += "Content-Length: " + std::to_string(body.size()) + "\r\n";
	ret += extra_headers;
	if (req.close) ret += "Connection: close\r\n";
	ret += "\r\n";
	if (send_body) ret += body;
	return ret;
}

struct web_server;

struct connection : std::enable_shared_from_this<connection>
{
	connection(web_server& s, tcp::socket sock)
		: m_server(s), m_socket(std::move(sock)) {}

	void start() { read_head(); }

private:

	void read_head();
	void on_head(error_code const& ec, std::size_t bytes);
	void read_body();
	void on_body(error_code const& ec);
	void respond();

	web_server& m_server;
	tcp::socket m_socket;
	asio::streambuf m_buffer;
	request m_request;
	std::string m_out;
};

struct web_server
{
	asio::io_context m_ios;
	tcp::acceptor m_acceptor{m_ios};
	std::atomic<int> m_requests{0};
	int m_port = 0;

	std::shared_ptr<std::thread> m_thread;

	web_server()
	{
		error_code ec;
		m_acceptor.open(tcp::v4(), ec);
		if (ec)
		{
			std::printf("WEB Error opening listen socket: %s\n", ec.message().c_str());
			return;
		}
		m_acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
		m_acceptor.bind(tcp::endpoint(asio::ip::address_v4::loopback(), 0), ec);
		if (ec)
		{
			std::printf("WEB Error binding to port 0: %s\n", ec.message().c_str());
			return;
		}
		m_port = m_acceptor.local_endpoint(ec).port();
		if (ec)
		{
			std::printf("WEB Error getting local endpoint: %s\n", ec.message().c_str());
			return;
		}
		m_acceptor.listen(64, ec);
		if (ec)
		{
			std::printf("WEB Error listening: %s\n", ec.message().c_str());
			return;
		}

		std::printf("WEB server initialized on port %d\n", m_port);

		accept();
		m_thread = std::make_shared<std::thread>([this] { m_ios.run(); });
	}

	~web_server()
	{
		m_ios.stop();
		if (m_thread) m_thread->join();
	}

	int port() const { return m_port; }

	void accept()
	{
		m_acceptor.async_accept([this](error_code const& ec, tcp::socket sock)
		{
			if (ec == asio::error::operation_aborted
				|| ec == asio::error::bad_descriptor) return;
			if (ec)
			{
				std::printf("WEB Error accepting connection: %s\n", ec.message().c_str());
				return;
			}
			std::make_shared<connection>(*this, std::move(sock))->start();
			accept();
		});
	}
};

void connection::read_head()
{
	m_request = request();
	asio::async_read_until(m_socket, m_buffer, "\r\n\r\n"
		, [self = shared_from_this()](error_code const& ec, std::size_t bytes)
		{ self->on_head(ec, bytes); });
}

void connection::on_head(error_code const& ec, std::size_t const bytes)
{
	// the client closed a kept-alive connection
	if (ec) return;

	std::string head(asio::buffers_begin(m_buffer.data())
		, asio::buffers_begin(m_buffer.data()) + std::ptrdiff_t(bytes));
	m_buffer.consume(bytes);

	if (!parse_request(head, m_request))
	{
		std::printf("WEB malformed request\n");
		return;
	}

	if (m_request.expect_continue && m_request.content_length > 0)
	{
		m_out = "HTTP/1.1 100 Continue\r\n\r\n";
		asio::async_write(m_socket, asio::buffer(m_out)
			, [self = shared_from_this()](error_code const& e, std::size_t)
			{
				if (e) return;
				self->read_body();
			});
		return;
	}
	read_body();
}

void connection::read_body()
{
	if (m_buffer.size() >= m_request.content_length)
	{
		on_body(error_code());
		return;
	}

	asio::async_read(m_socket, m_buffer
		, asio::transfer_exactly(m_request.content_length - m_buffer.size())
		, [self = shared_from_this()](error_code const& ec, std::size_t)
		{ self->on_body(ec); });
}

void connection::on_body(error_code const& ec)
{
	if (ec)
	{
		std::printf("WEB Error reading request body: %s\n", ec.message().c_str());
		return;
	}

	std::size_t const n = m_request.content_length;
	m_request.body.assign(asio::buffers_begin(m_buffer.data())
		, asio::buffers_begin(m_buffer.data()) + std::ptrdiff_t(n));
	m_buffer.consume(n);
	respond();
}

void connection::respond()
{
	++m_server.m_requests;
	std::printf("WEB %s %s\n", m_request.method.c_str(), m_request.target.c_str());

	m_out = build_response(m_request);
	asio::async_write(m_socket, asio::buffer(m_out)
		, [self = shared_from_this()](error_code const& ec, std::size_t)
		{
			// the client may hang up before reading everything
			if (ec) return;
			if (self->m_request.close)
			{
				error_code ignore;
				self->m_socket.shutdown(tcp::socket::shutdown_both, ignore);
				self->m_socket.close(ignore);
				return;
			}
			self->read_head();
		});
}

std::shared_ptr<web_server> g_web_server;

} // anonymous namespace

int start_web_server()
{
	g_web_server.reset();
	g_web_server = std::make_shared<web_server>();
	return g_web_server->port();
}

void stop_web_server()
{
	g_web_server.reset();
}

int num_web_server_requests()
{
	if (g_web_server) return g_web_server->m_requests;
	return 0;
}

std::string web_server_url(std::string const& path)
{
	int const port = g_web_server ? g_web_server->port() : 0;
	return "http://127.0.0.1:" + std::to_string(port) + path;
}

std::multimap<std::string, std::string> parse_echo(std::string const& body)
{
	std::multimap<std::string, std::string> ret;
	std::istringstream in(body);
	std::string line;
	while (std::getline(in, line))
	{
		auto const sep = line.find(": ");
		if (sep == std::string::npos) continue;
		ret.emplace(line.substr(0, sep), line.substr(sep + 2));
	}
	return ret;
}

std::string echo_value(std::multimap<std::string, std::string> const& echo
	, std::string const& key)
{
	auto const i = echo.find(key);
	if (i == echo.end()) return {};
	return i->second;
}

char large_body_byte(std::size_t const i)
{
	return char('a' + i % 26);
}
