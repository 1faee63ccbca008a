/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLHTTP_EXPORT_HPP_INCLUDED
#define CURLHTTP_EXPORT_HPP_INCLUDED

#include <boost/config.hpp>

#if defined CURLHTTP_BUILDING_SHARED
# define CURLHTTP_EXPORT BOOST_SYMBOL_EXPORT
#elif defined CURLHTTP_LINKING_SHARED
# define CURLHTTP_EXPORT BOOST_SYMBOL_IMPORT
#endif

// when this is specified, export a bunch of extra
// symbols, mostly for the unit tests to reach
#if defined CURLHTTP_EXPORT_EXTRA
# if defined CURLHTTP_BUILDING_SHARED
#  define CURLHTTP_EXTRA_EXPORT BOOST_SYMBOL_EXPORT
# elif defined CURLHTTP_LINKING_SHARED
#  define CURLHTTP_EXTRA_EXPORT BOOST_SYMBOL_IMPORT
# endif
#endif

#ifndef CURLHTTP_EXPORT
# define CURLHTTP_EXPORT
#endif

#ifndef CURLHTTP_EXTRA_EXPORT
# define CURLHTTP_EXTRA_EXPORT
#endif

#endif
