// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Range.hxx"
#include "util/CharUtil.hxx"

#include <fmt/core.h>

#include <assert.h>
#include <string.h>
#include <stdlib.h>

using std::string_view_literals::operator""sv;

std::string
HttpFormatRangeFrom(uint64_t offset)
{
	return fmt::format("bytes={}-"sv, offset);
}

static bool
ParseUint64(const char *&p, uint64_t &value_r) noexcept
{
	/* strtoull() would accept leading whitespace and a sign */
	if (!IsDigitASCII(*p))
		return false;

	char *endptr;
	value_r = strtoull(p, &endptr, 10);
	p = endptr;
	return true;
}

bool
HttpContentRange::Parse(const char *p) noexcept
{
	assert(p != nullptr);

	if (strncmp(p, "bytes ", 6) != 0)
		return false;

	p += 6;

	if (!ParseUint64(p, first) || *p++ != '-' ||
	    !ParseUint64(p, last) || *p++ != '/' ||
	    last < first)
		return false;

	if (*p == '*') {
		++p;
		total = UNKNOWN_TOTAL;
	} else if (!ParseUint64(p, total) || last >= total)
		return false;

	return *p == 0;
}
