// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstdint>
#include <string>

/**
 * Generate the value of a "Range" request header which asks for
 * everything from the given offset to the end of the resource,
 * i.e. "bytes=OFFSET-".
 */
std::string
HttpFormatRangeFrom(uint64_t offset);

/**
 * A parsed "Content-Range" response header.
 */
struct HttpContentRange {
	static constexpr uint64_t UNKNOWN_TOTAL = ~uint64_t{};

	/**
	 * The first and last byte positions (inclusive).
	 */
	uint64_t first = 0, last = 0;

	/**
	 * The complete length of the resource, or #UNKNOWN_TOTAL if
	 * the server sent "*".
	 */
	uint64_t total = UNKNOWN_TOTAL;

	/**
	 * Parse a "Content-Range" response header of the form
	 * "bytes FIRST-LAST/TOTAL".
	 *
	 * @return false on syntax error or if the range is not
	 * consistent
	 */
	bool Parse(const char *p) noexcept;
};
