/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLHTTP_SCOPE_END_HPP_INCLUDED
#define CURLHTTP_SCOPE_END_HPP_INCLUDED

#include <utility>

namespace curlhttp::aux {

	// runs the function on scope exit unless disarmed. Used to release
	// native resources when a constructor throws half way through.
	template <typename Fun>
	struct scope_end_impl
	{
		explicit scope_end_impl(Fun f) : m_fun(std::move(f)) {}
		~scope_end_impl() { if (m_armed) m_fun(); }

		scope_end_impl(scope_end_impl&&) noexcept = default;
		scope_end_impl& operator=(scope_end_impl&&) & noexcept = default;
		scope_end_impl(scope_end_impl const&) = delete;
		scope_end_impl& operator=(scope_end_impl const&) = delete;

		void disarm() { m_armed = false; }
	private:
		Fun m_fun;
		bool m_armed = true;
	};

	template <typename Fun>
	scope_end_impl<Fun> scope_end(Fun f) { return scope_end_impl<Fun>(std::move(f)); }
}

#endif
