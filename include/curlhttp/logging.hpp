/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLHTTP_LOGGING_HPP_INCLUDED
#define CURLHTTP_LOGGING_HPP_INCLUDED

#include "curlhttp/config.hpp"

#include <cstdint>
#include <memory>

namespace curlhttp {

	enum class log_level : std::uint8_t
	{
		debug,
		info,
		warning,
		error
	};

	CURLHTTP_EXPORT char const* log_level_name(log_level l);

	// the sink for all diagnostics produced by the library. Install a custom
	// one with set_logger() to route messages elsewhere. log() may be called
	// from any thread, including the threads consuming response channels.
	struct CURLHTTP_EXPORT logger
	{
		virtual bool should_log(log_level l) const = 0;
		virtual void log(log_level l, char const* msg) = 0;

		logger() = default;
		logger(logger const&) = default;
		logger& operator=(logger const&) = default;
		virtual ~logger() = default;
	};

	// writes "[level] message" lines to stderr, dropping anything below
	// the configured level
	struct CURLHTTP_EXPORT stderr_logger final : logger
	{
		explicit stderr_logger(log_level threshold = log_level::warning)
			: m_threshold(threshold) {}

		bool should_log(log_level l) const override;
		void log(log_level l, char const* msg) override;

	private:
		log_level m_threshold;
	};

	// replace the process-wide logger. Passing nullptr restores the default
	// stderr_logger.
	CURLHTTP_EXPORT void set_logger(std::shared_ptr<logger> l);
	CURLHTTP_EXPORT std::shared_ptr<logger> get_logger();

namespace aux {

#ifndef CURLHTTP_DISABLE_LOGGING
	CURLHTTP_EXTRA_EXPORT bool should_log(log_level l);
	CURLHTTP_EXTRA_EXPORT void log(log_level l, char const* fmt, ...) CURLHTTP_FORMAT(2,3);
#else
	inline bool should_log(log_level) { return false; }
	inline void log(log_level, char const*, ...) {}
#endif

}
}

#endif
