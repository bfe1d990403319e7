// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Status.hxx"

static constexpr struct {
	HttpStatus status;
	const char *text;
} http_status_to_string_input[] = {
	{ HttpStatus::OK, "200 OK" },
	{ HttpStatus::NO_CONTENT, "204 No Content" },
	{ HttpStatus::PARTIAL_CONTENT, "206 Partial Content" },
	{ HttpStatus::MOVED_PERMANENTLY, "301 Moved Permanently" },
	{ HttpStatus::FOUND, "302 Found" },
	{ HttpStatus::SEE_OTHER, "303 See Other" },
	{ HttpStatus::NOT_MODIFIED, "304 Not Modified" },
	{ HttpStatus::TEMPORARY_REDIRECT, "307 Temporary Redirect" },
	{ HttpStatus::PERMANENT_REDIRECT, "308 Permanent Redirect" },
	{ HttpStatus::BAD_REQUEST, "400 Bad Request" },
	{ HttpStatus::UNAUTHORIZED, "401 Unauthorized" },
	{ HttpStatus::FORBIDDEN, "403 Forbidden" },
	{ HttpStatus::NOT_FOUND, "404 Not Found" },
	{ HttpStatus::METHOD_NOT_ALLOWED, "405 Method Not Allowed" },
	{ HttpStatus::CONFLICT, "409 Conflict" },
	{ HttpStatus::GONE, "410 Gone" },
	{ HttpStatus::PRECONDITION_FAILED, "412 Precondition Failed" },
	{ HttpStatus::REQUESTED_RANGE_NOT_SATISFIABLE,
	  "416 Requested Range Not Satisfiable" },
	{ HttpStatus::TOO_MANY_REQUESTS, "429 Too Many Requests" },
	{ HttpStatus::INTERNAL_SERVER_ERROR, "500 Internal Server Error" },
	{ HttpStatus::NOT_IMPLEMENTED, "501 Not Implemented" },
	{ HttpStatus::BAD_GATEWAY, "502 Bad Gateway" },
	{ HttpStatus::SERVICE_UNAVAILABLE, "503 Service Unavailable" },
	{ HttpStatus::GATEWAY_TIMEOUT, "504 Gateway Timeout" },
};

static constexpr auto
MakeHttpStatusToStringData() noexcept
{
	std::array<std::array<const char *, 30>, 6> result{};

	for (const auto &i : http_status_to_string_input) {
		const auto status = static_cast<unsigned>(i.status);
		result[status / 100][status % 100] = i.text;
	}

	return result;
}

constinit const std::array<std::array<const char *, 30>, 6> http_status_to_string_data =
	MakeHttpStatusToStringData();
