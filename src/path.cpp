/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlhttp/config.hpp"
#include "curlhttp/aux_/path.hpp"

#include <cerrno>
#include <sys/stat.h>

namespace curlhttp::aux {

	bool exists(std::string const& f, error_code& ec)
	{
		ec.clear();
		struct ::stat buf;
		if (::stat(f.c_str(), &buf) == 0) return true;

		int const err = errno;
		if (err != ENOENT && err != ENOTDIR)
			ec.assign(err, boost::system::generic_category());
		return false;
	}

	bool exists(std::string const& f)
	{
		error_code ec;
		return exists(f, ec);
	}
}
