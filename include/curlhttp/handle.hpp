/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLHTTP_HANDLE_HPP_INCLUDED
#define CURLHTTP_HANDLE_HPP_INCLUDED

#include "curlhttp/config.hpp"
#include "curlhttp/error_code.hpp"

namespace curlhttp {

	// the interface shared by easy_handle and multi_handle
	struct CURLHTTP_EXPORT handle
	{
		// release the native resources held by the handle. Calling it more
		// than once is allowed, the handle is inert afterwards.
		virtual void cleanup() noexcept = 0;

		// drive the handle's transfer(s) to completion. The error is in
		// curl_category() for easy handles and curl_multi_category() for
		// multi handles.
		virtual error_code run() = 0;

		// false once cleanup() has been called
		virtual bool valid() const noexcept = 0;

		handle() = default;
		handle(handle const&) = delete;
		handle& operator=(handle const&) = delete;
		virtual ~handle() = default;
	};
}

#endif
