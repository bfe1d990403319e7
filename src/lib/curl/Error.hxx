// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include <curl/curl.h>

#include <stdexcept>
#include <string>

namespace Curl {

/**
 * An error reported by libcurl.
 */
class Error : public std::runtime_error {
	CURLcode code;

public:
	Error(CURLcode _code, const std::string &_msg) noexcept
		:std::runtime_error(_msg), code(_code) {}

	CURLcode GetCode() const noexcept {
		return code;
	}
};

/**
 * Construct an #Error with a message built from the given prefix and
 * the libcurl error string (or the contents of the error buffer, if
 * one is given and non-empty).
 */
[[gnu::pure]]
Error
MakeError(CURLcode code, const char *prefix,
	  const char *error_buffer=nullptr) noexcept;

} // namespace Curl
