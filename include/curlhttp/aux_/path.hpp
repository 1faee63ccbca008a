/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLHTTP_PATH_HPP_INCLUDED
#define CURLHTTP_PATH_HPP_INCLUDED

#include "curlhttp/config.hpp"
#include "curlhttp/error_code.hpp"

#include <string>

namespace curlhttp::aux {

	// returns true if ``f`` names an existing file or directory. A missing
	// file is not an error, ``ec`` is only set if stat() fails for any other
	// reason.
	CURLHTTP_EXTRA_EXPORT bool exists(std::string const& f, error_code& ec);
	CURLHTTP_EXTRA_EXPORT bool exists(std::string const& f);
}

#endif
