// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <array>
#include <cstdint>

enum class HttpStatus : uint_least16_t {
	/**
	 * Not an actual HTTP status code, but a "magic" value which
	 * means this status has no value.  This can be used as an
	 * initializer.
	 */
	UNDEFINED = 0,

	OK = 200,
	NO_CONTENT = 204,
	PARTIAL_CONTENT = 206,

	MOVED_PERMANENTLY = 301,
	FOUND = 302,
	SEE_OTHER = 303,
	NOT_MODIFIED = 304,
	TEMPORARY_REDIRECT = 307,

	/**
	 * @see RFC 7538
	 */
	PERMANENT_REDIRECT = 308,

	BAD_REQUEST = 400,
	UNAUTHORIZED = 401,
	FORBIDDEN = 403,
	NOT_FOUND = 404,
	METHOD_NOT_ALLOWED = 405,
	CONFLICT = 409,
	GONE = 410,
	PRECONDITION_FAILED = 412,
	REQUESTED_RANGE_NOT_SATISFIABLE = 416,

	/**
	 * @see RFC 6585 (Additional HTTP Status Codes)
	 */
	TOO_MANY_REQUESTS = 429,

	INTERNAL_SERVER_ERROR = 500,
	NOT_IMPLEMENTED = 501,
	BAD_GATEWAY = 502,
	SERVICE_UNAVAILABLE = 503,
	GATEWAY_TIMEOUT = 504,
};

extern const std::array<std::array<const char *, 30>, 6> http_status_to_string_data;

static constexpr bool
http_status_is_valid(HttpStatus _status) noexcept
{
	const auto status = static_cast<unsigned>(_status);
	return status >= 100 && status < 600;
}

/**
 * Returns the status line text (e.g. "404 Not Found") or nullptr if
 * this status code is not known.
 */
[[gnu::pure]]
static inline const char *
http_status_to_string(HttpStatus _status) noexcept
{
	const auto status = static_cast<unsigned>(_status);
	if (status / 100 >= http_status_to_string_data.size() ||
	    status % 100 >= http_status_to_string_data.front().size())
		return nullptr;

	return http_status_to_string_data[status / 100][status % 100];
}

static constexpr bool
http_status_is_success(HttpStatus _status) noexcept
{
	const auto status = static_cast<unsigned>(_status);
	return status >= 200 && status < 300;
}

static constexpr bool
http_status_is_redirect(HttpStatus _status) noexcept
{
	const auto status = static_cast<unsigned>(_status);
	return status >= 300 && status < 400;
}

static constexpr bool
http_status_is_client_error(HttpStatus _status) noexcept
{
	const auto status = static_cast<unsigned>(_status);
	return status >= 400 && status < 500;
}

static constexpr bool
http_status_is_server_error(HttpStatus _status) noexcept
{
	const auto status = static_cast<unsigned>(_status);
	return status >= 500 && status < 600;
}
