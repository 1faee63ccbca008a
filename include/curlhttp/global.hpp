/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLHTTP_GLOBAL_HPP_INCLUDED
#define CURLHTTP_GLOBAL_HPP_INCLUDED

#include "curlhttp/config.hpp"

#include <string>

namespace curlhttp {

	// Handles initialize libcurl on first use. Programs that want libcurl's
	// global state torn down at a well defined point can hold one of these
	// for the lifetime of main(). No handle may outlive it.
	struct CURLHTTP_EXPORT global_initializer
	{
		global_initializer();
		~global_initializer();

		global_initializer(global_initializer const&) = delete;
		global_initializer& operator=(global_initializer const&) = delete;
	};

	// the first CA bundle found in the locations used by common
	// distributions, or an empty string if there is none
	CURLHTTP_EXPORT std::string default_ca_bundle();
}

#endif
