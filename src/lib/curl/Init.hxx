// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Error.hxx"

#include <curl/curl.h>

/**
 * Initialize libcurl globally for the lifetime of this object.
 */
class ScopeCurlInit {
public:
	ScopeCurlInit() {
		CURLcode code = curl_global_init(CURL_GLOBAL_ALL);
		if (code != CURLE_OK)
			throw Curl::MakeError(code, "CURL initialization failed");
	}

	~ScopeCurlInit() noexcept {
		curl_global_cleanup();
	}

	ScopeCurlInit(const ScopeCurlInit &) = delete;
	ScopeCurlInit &operator=(const ScopeCurlInit &) = delete;
};
