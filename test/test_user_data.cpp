/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "test.hpp"

#include "curlhttp/easy_handle.hpp"
#include "curlhttp/user_data.hpp"

#include <any>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace curlhttp;

CURLHTTP_TEST(set_get)
{
	user_data d;
	TEST_CHECK(d.empty());

	d.set("name", std::string("value"));
	d.set("count", 3);
	d.set("list", std::vector<int>{1, 2, 3});

	TEST_EQUAL(d.size(), 3u);
	TEST_CHECK(d.has("name"));
	TEST_EQUAL(d.get<std::string>("name"), "value");
	TEST_EQUAL(d.get<int>("count"), 3);
	TEST_EQUAL(d.get<std::vector<int>>("list").size(), 3u);

	// values can be modified in place
	d.get<int>("count") += 1;
	TEST_EQUAL(d.get<int>("count"), 4);
}

CURLHTTP_TEST(overwrite)
{
	user_data d;
	d.set("key", 1);
	d.set("key", std::string("now a string"));
	TEST_EQUAL(d.size(), 1u);
	TEST_EQUAL(d.get<std::string>("key"), "now a string");
	TEST_CHECK(d.find<int>("key") == nullptr);
}

CURLHTTP_TEST(missing_and_mistyped)
{
	user_data d;
	d.set("count", 3);

	TEST_CHECK(!d.has("other"));
	TEST_CHECK(d.find<int>("other") == nullptr);
	TEST_CHECK(d.find<double>("count") == nullptr);
	TEST_CHECK(d.find<int>("count") != nullptr);

	try
	{
		d.get<int>("other");
		TEST_ERROR("missing key was found");
	}
	catch (std::out_of_range const&) {}

	try
	{
		d.get<double>("count");
		TEST_ERROR("value was cast to the wrong type");
	}
	catch (std::bad_any_cast const&) {}
}

CURLHTTP_TEST(erase_and_clear)
{
	user_data d;
	d.set("a", 1);
	d.set("b", 2);
	TEST_CHECK(d.erase("a"));
	TEST_CHECK(!d.erase("a"));
	TEST_EQUAL(d.size(), 1u);
	d.clear();
	TEST_CHECK(d.empty());
}

CURLHTTP_TEST(attached_to_handle)
{
	easy_params p;
	p.url = "http://127.0.0.1/";
	easy_handle h(p);
	TEST_CHECK(h.userdata().empty());

	h.userdata().set("request", std::map<std::string, int>{{"id", 7}});
	easy_handle const& ch = h;
	TEST_EQUAL((ch.userdata().get<std::map<std::string, int>>("request").at("id")), 7);
}
