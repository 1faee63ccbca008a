/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLHTTP_USER_DATA_HPP_INCLUDED
#define CURLHTTP_USER_DATA_HPP_INCLUDED

#include "curlhttp/config.hpp"

#include <any>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>

namespace curlhttp {

	// a string keyed map of arbitrary values attached to an easy_handle. The
	// library never reads or writes it, it exists to carry caller context
	// through a multi_handle::execute() to the point where results are
	// inspected.
	struct user_data
	{
		template <typename T>
		void set(std::string const& key, T&& value)
		{ m_values[key] = std::forward<T>(value); }

		// throws std::out_of_range if ``key`` is not set and std::bad_any_cast
		// if it holds a value of a different type
		template <typename T>
		T& get(std::string const& key)
		{ return std::any_cast<T&>(m_values.at(key)); }

		template <typename T>
		T const& get(std::string const& key) const
		{ return std::any_cast<T const&>(m_values.at(key)); }

		// returns nullptr if ``key`` is not set or is of another type
		template <typename T>
		T* find(std::string const& key)
		{
			auto const i = m_values.find(key);
			if (i == m_values.end()) return nullptr;
			return std::any_cast<T>(&i->second);
		}

		template <typename T>
		T const* find(std::string const& key) const
		{
			auto const i = m_values.find(key);
			if (i == m_values.end()) return nullptr;
			return std::any_cast<T>(&i->second);
		}

		bool has(std::string const& key) const
		{ return m_values.count(key) > 0; }

		// returns true if ``key`` was set
		bool erase(std::string const& key)
		{ return m_values.erase(key) > 0; }

		std::size_t size() const { return m_values.size(); }
		bool empty() const { return m_values.empty(); }
		void clear() { m_values.clear(); }

	private:
		std::unordered_map<std::string, std::any> m_values;
	};
}

#endif
