/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlhttp/config.hpp"
#include "curlhttp/assert.hpp"

#include <cstdio>
#include <cstdlib>

namespace curlhttp {

void assert_fail(char const* expr, int const line
	, char const* file, char const* function)
{
	std::fprintf(stderr, "assertion failed. Please file a bugreport.\n"
		"version: " CURLHTTP_VERSION "\n"
		"file: '%s'\n"
		"line: %d\n"
		"function: %s\n"
		"expression: %s\n"
		, file, line, function, expr);
	std::fflush(stderr);
	std::abort();
}

}
