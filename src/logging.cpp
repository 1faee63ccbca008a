/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlhttp/config.hpp"
#include "curlhttp/logging.hpp"

#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace curlhttp {

	char const* log_level_name(log_level const l)
	{
		switch (l)
		{
			case log_level::debug: return "debug";
			case log_level::info: return "info";
			case log_level::warning: return "warning";
			case log_level::error: return "error";
		}
		return "unknown";
	}

	bool stderr_logger::should_log(log_level const l) const
	{
		return l >= m_threshold;
	}

	void stderr_logger::log(log_level const l, char const* msg)
	{
		std::fprintf(stderr, "[%s] %s\n", log_level_name(l), msg);
	}

namespace {

	std::mutex g_logger_mutex;

	std::shared_ptr<logger>& logger_slot()
	{
		static std::shared_ptr<logger> inst = std::make_shared<stderr_logger>();
		return inst;
	}
}

	void set_logger(std::shared_ptr<logger> l)
	{
		if (!l) l = std::make_shared<stderr_logger>();
		std::lock_guard<std::mutex> lock(g_logger_mutex);
		logger_slot() = std::move(l);
	}

	std::shared_ptr<logger> get_logger()
	{
		std::lock_guard<std::mutex> lock(g_logger_mutex);
		return logger_slot();
	}

#ifndef CURLHTTP_DISABLE_LOGGING
namespace aux {

	bool should_log(log_level const l)
	{
		return get_logger()->should_log(l);
	}

	void log(log_level const l, char const* fmt, ...)
	{
		std::shared_ptr<logger> const sink = get_logger();
		if (!sink->should_log(l)) return;

		char buf[1024];
		va_list v;
		va_start(v, fmt);
		std::vsnprintf(buf, sizeof(buf), fmt, v);
		va_end(v);
		sink->log(l, buf);
	}
}
#endif
}
