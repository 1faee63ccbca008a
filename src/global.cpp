/*

Copyright (c) 2026, the curlhttp authors
All rights reserved.

You may use, distribute and modify this code under the terms of the BSD license,
see LICENSE file.
*/

#include "curlhttp/config.hpp"
#include "curlhttp/global.hpp"
#include "curlhttp/error_code.hpp"
#include "curlhttp/aux_/curl.hpp"
#include "curlhttp/aux_/path.hpp"
#include "curlhttp/aux_/throw.hpp"

#include <mutex>

#include <curl/curl.h>

namespace curlhttp {

namespace aux {

	void ensure_global_init()
	{
		static std::once_flag curl_init_flag;
		std::call_once(curl_init_flag, []() {
			CURLcode const result = curl_global_init(CURL_GLOBAL_ALL);
			if (result != CURLE_OK)
				throw_ex<curl_easy_error>(result, "curl_global_init");
		});
	}
}

	global_initializer::global_initializer()
	{
		aux::ensure_global_init();
	}

	global_initializer::~global_initializer()
	{
		curl_global_cleanup();
	}

	std::string default_ca_bundle()
	{
		static char const* const bundles[] =
		{
			"/etc/ssl/certs/ca-certificates.crt", // Debian, Ubuntu, Arch, Gentoo
			"/etc/pki/tls/certs/ca-bundle.crt", // Fedora, RHEL 6
			"/etc/pki/ca-trust/extracted/pem/tls-ca-bundle.pem", // CentOS, RHEL 7
			"/etc/ssl/ca-bundle.pem", // openSUSE
			"/etc/ssl/cert.pem", // Alpine, macOS
			"/usr/local/share/certs/ca-root-nss.crt", // FreeBSD
			"/opt/local/share/curl/curl-ca-bundle.crt", // macOS ports
		};

		for (char const* b : bundles)
		{
			if (aux::exists(b)) return b;
		}
		return {};
	}
}
