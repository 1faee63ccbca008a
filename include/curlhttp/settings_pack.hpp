/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#ifndef CURLHTTP_SETTINGS_PACK_HPP_INCLUDED
#define CURLHTTP_SETTINGS_PACK_HPP_INCLUDED

#include "curlhttp/config.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// OVERVIEW
//
// The settings_pack carries library-wide defaults that are read each time a
// handle is constructed. Settings are addressed by the enum values below;
// the high bits of a value encode its type (string, int or bool).
//
// A process-wide pack lives behind apply_settings() and global_settings().
// It is meant to be set once at startup. Handles that are given an explicit
// pack at construction never look at the process-wide one. That pack is
// applied on top of default_settings(), settings it does not set keep their
// default values.
namespace curlhttp {

	struct CURLHTTP_EXPORT settings_pack
	{
		void set_str(int name, std::string val);
		void set_int(int name, int val);
		void set_bool(int name, bool val);
		bool has_val(int name) const;

		// clear the settings pack from all settings
		void clear();

		// clear a specific setting from the pack
		void clear(int name);

		// if the setting is not set in the pack, the empty string, 0 or false
		// is returned
		std::string const& get_str(int name) const;
		int get_int(int name) const;
		bool get_bool(int name) const;

		// return a copy of this pack with every setting this pack does not
		// set taken from ``fallback``
		settings_pack merged_onto(settings_pack const& fallback) const;

		// setting names (indices) are 16 bits. The two most significant bits
		// indicate what type the setting has (string, int, bool)
		enum type_bases
		{
			string_type_base = 0x0000,
			int_type_base =    0x4000,
			bool_type_base =   0x8000,
			type_mask =        0xc000,
			index_mask =       0x3fff
		};

		enum string_types
		{
			// the value passed as the User-Agent header by handles constructed
			// without an explicit user agent. Unset by default, in which case
			// libcurl's own default applies.
			user_agent = string_type_base,

			// the CA bundle used by handles constructed without a cacertpath.
			// When empty, the platform trust store is looked up.
			ca_cert_path,

			max_string_setting_internal
		};

		enum int_types
		{
			// the number of items a response channel holds before the transfer
			// writing into it blocks
			channel_capacity = int_type_base,

			// the upper bound, in milliseconds, of one wait in the multi
			// handle's poll loop
			poll_timeout_ms,

			// CURLMOPT_MAX_HOST_CONNECTIONS for new multi handles. 0 leaves
			// libcurl's default in place.
			max_host_connections,

			// CURLMOPT_MAX_TOTAL_CONNECTIONS for new multi handles. 0 leaves
			// libcurl's default in place.
			max_total_connections,

			max_int_setting_internal
		};

		enum bool_types
		{
			// the verbose flag of handles constructed without one
			verbose_logging = bool_type_base,

			max_bool_setting_internal
		};

		constexpr static int num_string_settings = int(max_string_setting_internal) - int(string_type_base);
		constexpr static int num_int_settings = int(max_int_setting_internal) - int(int_type_base);
		constexpr static int num_bool_settings = int(max_bool_setting_internal) - int(bool_type_base);

	private:

		std::vector<std::pair<std::uint16_t, std::string>> m_strings;
		std::vector<std::pair<std::uint16_t, int>> m_ints;
		std::vector<std::pair<std::uint16_t, bool>> m_bools;
	};

	// converts a setting integer (from the enums string_types, int_types or
	// bool_types) to a string, and vice versa. setting_by_name() returns -1
	// for unknown names.
	CURLHTTP_EXPORT int setting_by_name(std::string const& name);
	CURLHTTP_EXPORT char const* name_for_setting(int s);

	// returns a settings_pack with every setting that has a default value
	// set to it
	CURLHTTP_EXPORT settings_pack default_settings();

	// merge the settings in ``pack`` into the process-wide pack
	CURLHTTP_EXPORT void apply_settings(settings_pack const& pack);

	// a snapshot of the process-wide pack
	CURLHTTP_EXPORT settings_pack global_settings();

	// set or, with std::nullopt, clear the process-wide default user agent
	CURLHTTP_EXPORT void set_default_user_agent(std::optional<std::string> ua);

	// restore the process-wide pack to default_settings()
	CURLHTTP_EXPORT void reset_global_settings();
}

#endif
