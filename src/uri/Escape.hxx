// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <string>
#include <string_view>

/**
 * Append the URI-escaped form of #src to #dest.  All characters
 * except the unreserved ones (RFC 3986 2.3) and those listed in
 * #keep are replaced with '%' and two upper-case hex digits.
 */
void
UriEscapeAppend(std::string &dest, std::string_view src,
		std::string_view keep={});

std::string
UriEscape(std::string_view src, std::string_view keep={});
