/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLHTTP_ASSERT_HPP_INCLUDED
#define CURLHTTP_ASSERT_HPP_INCLUDED

#include "curlhttp/config.hpp"

namespace curlhttp {

// internal
[[noreturn]] CURLHTTP_EXPORT void assert_fail(char const* expr, int line
	, char const* file, char const* function);

}

#if CURLHTTP_USE_ASSERTS

#define CURLHTTP_ASSERT(x) \
	do { if (x) {} else curlhttp::assert_fail(#x, __LINE__, __FILE__, __func__); } while (false)

#else

#define CURLHTTP_ASSERT(a) do {} while(false)

#endif

#endif // CURLHTTP_ASSERT_HPP_INCLUDED
