/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLHTTP_CONFIG_HPP_INCLUDED
#define CURLHTTP_CONFIG_HPP_INCLUDED

#include "curlhttp/export.hpp"

#define CURLHTTP_VERSION_MAJOR 1
#define CURLHTTP_VERSION_MINOR 0
#define CURLHTTP_VERSION_TINY 0

#define CURLHTTP_VERSION "1.0.0"

#ifndef CURLHTTP_USE_ASSERTS
#ifdef NDEBUG
#define CURLHTTP_USE_ASSERTS 0
#else
#define CURLHTTP_USE_ASSERTS 1
#endif
#endif

#if defined __GNUC__ || defined __clang__
#define CURLHTTP_FORMAT(fmt, ellipsis) __attribute__((__format__(__printf__, fmt, ellipsis)))
#else
#define CURLHTTP_FORMAT(fmt, ellipsis)
#endif

#endif // CURLHTTP_CONFIG_HPP_INCLUDED
