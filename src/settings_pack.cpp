/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlhttp/config.hpp"
#include "curlhttp/assert.hpp"
#include "curlhttp/settings_pack.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <mutex>

namespace {

	template <class T>
	bool compare_first(std::pair<std::uint16_t, T> const& lhs
		, std::pair<std::uint16_t, T> const& rhs)
	{
		return lhs.first < rhs.first;
	}

	template <class T>
	void insort_replace(std::vector<std::pair<std::uint16_t, T>>& c, std::pair<std::uint16_t, T> v)
	{
		auto i = std::lower_bound(c.begin(), c.end(), v, &compare_first<T>);
		if (i != c.end() && i->first == v.first) i->second = std::move(v.second);
		else c.emplace(i, std::move(v));
	}

	template <class T>
	auto find_setting(std::vector<std::pair<std::uint16_t, T>> const& c, int const name)
	{
		std::pair<std::uint16_t, T> v(static_cast<std::uint16_t>(name), T());
		auto const i = std::lower_bound(c.begin(), c.end(), v, &compare_first<T>);
		return (i != c.end() && i->first == name) ? i : c.end();
	}

	template <class T>
	void erase_setting(std::vector<std::pair<std::uint16_t, T>>& c, int const name)
	{
		std::pair<std::uint16_t, T> v(static_cast<std::uint16_t>(name), T());
		auto const i = std::lower_bound(c.begin(), c.end(), v, &compare_first<T>);
		if (i != c.end() && i->first == name) c.erase(i);
	}
}

namespace curlhttp {

	struct str_setting_entry_t
	{
		// the name of this setting. used for setting_by_name()
		char const* name;
		// nullptr means the setting is unset by default
		char const* default_value;
	};

	struct int_setting_entry_t
	{
		char const* name;
		int default_value;
	};

	struct bool_setting_entry_t
	{
		char const* name;
		bool default_value;
	};

#define SET(name, default_value) { #name, default_value }

	namespace {

	std::array<str_setting_entry_t, settings_pack::num_string_settings> const str_settings
	{{
		SET(user_agent, nullptr),
		SET(ca_cert_path, "")
	}};

	std::array<int_setting_entry_t, settings_pack::num_int_settings> const int_settings
	{{
		SET(channel_capacity, 16),
		SET(poll_timeout_ms, 1000),
		SET(max_host_connections, 0),
		SET(max_total_connections, 0)
	}};

	std::array<bool_setting_entry_t, settings_pack::num_bool_settings> const bool_settings
	{{
		SET(verbose_logging, false)
	}};

#undef SET

	std::mutex g_settings_mutex;

	settings_pack& global_pack()
	{
		static settings_pack inst = default_settings();
		return inst;
	}

	} // anonymous namespace

	int setting_by_name(std::string const& key)
	{
		for (int k = 0; k < int(str_settings.size()); ++k)
		{
			if (key != str_settings[std::size_t(k)].name) continue;
			return settings_pack::string_type_base + k;
		}
		for (int k = 0; k < int(int_settings.size()); ++k)
		{
			if (key != int_settings[std::size_t(k)].name) continue;
			return settings_pack::int_type_base + k;
		}
		for (int k = 0; k < int(bool_settings.size()); ++k)
		{
			if (key != bool_settings[std::size_t(k)].name) continue;
			return settings_pack::bool_type_base + k;
		}
		return -1;
	}

	char const* name_for_setting(int const s)
	{
		std::size_t const idx = std::size_t(s & settings_pack::index_mask);
		switch (s & settings_pack::type_mask)
		{
			case settings_pack::string_type_base:
				if (idx < str_settings.size()) return str_settings[idx].name;
				break;
			case settings_pack::int_type_base:
				if (idx < int_settings.size()) return int_settings[idx].name;
				break;
			case settings_pack::bool_type_base:
				if (idx < bool_settings.size()) return bool_settings[idx].name;
				break;
		}
		return "";
	}

	settings_pack default_settings()
	{
		settings_pack ret;
		for (int i = 0; i < settings_pack::num_string_settings; ++i)
		{
			char const* def = str_settings[std::size_t(i)].default_value;
			if (def == nullptr) continue;
			ret.set_str(settings_pack::string_type_base + i, def);
		}

		for (int i = 0; i < settings_pack::num_int_settings; ++i)
		{
			ret.set_int(settings_pack::int_type_base + i
				, int_settings[std::size_t(i)].default_value);
		}

		for (int i = 0; i < settings_pack::num_bool_settings; ++i)
		{
			ret.set_bool(settings_pack::bool_type_base + i
				, bool_settings[std::size_t(i)].default_value);
		}
		return ret;
	}

	void apply_settings(settings_pack const& pack)
	{
		std::lock_guard<std::mutex> l(g_settings_mutex);
		settings_pack& g = global_pack();
		g = pack.merged_onto(g);
	}

	settings_pack global_settings()
	{
		std::lock_guard<std::mutex> l(g_settings_mutex);
		return global_pack();
	}

	void set_default_user_agent(std::optional<std::string> ua)
	{
		std::lock_guard<std::mutex> l(g_settings_mutex);
		if (ua) global_pack().set_str(settings_pack::user_agent, std::move(*ua));
		else global_pack().clear(settings_pack::user_agent);
	}

	void reset_global_settings()
	{
		std::lock_guard<std::mutex> l(g_settings_mutex);
		global_pack() = default_settings();
	}

	void settings_pack::set_str(int const name, std::string val)
	{
		CURLHTTP_ASSERT((name & type_mask) == string_type_base);
		if ((name & type_mask) != string_type_base) return;
		if ((name & index_mask) >= num_string_settings) return;
		insort_replace(m_strings, {static_cast<std::uint16_t>(name), std::move(val)});
	}

	void settings_pack::set_int(int const name, int const val)
	{
		CURLHTTP_ASSERT((name & type_mask) == int_type_base);
		if ((name & type_mask) != int_type_base) return;
		if ((name & index_mask) >= num_int_settings) return;
		insort_replace(m_ints, {static_cast<std::uint16_t>(name), val});
	}

	void settings_pack::set_bool(int const name, bool const val)
	{
		CURLHTTP_ASSERT((name & type_mask) == bool_type_base);
		if ((name & type_mask) != bool_type_base) return;
		if ((name & index_mask) >= num_bool_settings) return;
		insort_replace(m_bools, {static_cast<std::uint16_t>(name), val});
	}

	bool settings_pack::has_val(int const name) const
	{
		switch (name & type_mask)
		{
			case string_type_base:
				return find_setting(m_strings, name) != m_strings.end();
			case int_type_base:
				return find_setting(m_ints, name) != m_ints.end();
			case bool_type_base:
				return find_setting(m_bools, name) != m_bools.end();
		}
		return false;
	}

	std::string const& settings_pack::get_str(int const name) const
	{
		static std::string const empty;
		CURLHTTP_ASSERT((name & type_mask) == string_type_base);
		if ((name & type_mask) != string_type_base) return empty;

		auto const i = find_setting(m_strings, name);
		if (i != m_strings.end()) return i->second;
		return empty;
	}

	int settings_pack::get_int(int const name) const
	{
		CURLHTTP_ASSERT((name & type_mask) == int_type_base);
		if ((name & type_mask) != int_type_base) return 0;

		auto const i = find_setting(m_ints, name);
		if (i != m_ints.end()) return i->second;
		return 0;
	}

	bool settings_pack::get_bool(int const name) const
	{
		CURLHTTP_ASSERT((name & type_mask) == bool_type_base);
		if ((name & type_mask) != bool_type_base) return false;

		auto const i = find_setting(m_bools, name);
		if (i != m_bools.end()) return i->second;
		return false;
	}

	void settings_pack::clear()
	{
		m_strings.clear();
		m_ints.clear();
		m_bools.clear();
	}

	void settings_pack::clear(int const name)
	{
		switch (name & type_mask)
		{
			case string_type_base: erase_setting(m_strings, name); break;
			case int_type_base: erase_setting(m_ints, name); break;
			case bool_type_base: erase_setting(m_bools, name); break;
		}
	}

	settings_pack settings_pack::merged_onto(settings_pack const& fallback) const
	{
		settings_pack ret = fallback;
		for (auto const& p : m_strings) insort_replace(ret.m_strings, p);
		for (auto const& p : m_ints) insort_replace(ret.m_ints, p);
		for (auto const& p : m_bools) insort_replace(ret.m_bools, p);
		return ret;
	}
}
