// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Escape.hxx"
#include "uri/Chars.hxx"

static constexpr char hex_digits[] = "0123456789ABCDEF";

void
UriEscapeAppend(std::string &dest, std::string_view src,
		std::string_view keep)
{
	/* worst case */
	dest.reserve(dest.size() + src.size() * 3);

	for (const char ch : src) {
		if (IsUriUnreservedChar(ch) ||
		    keep.find(ch) != keep.npos) {
			dest.push_back(ch);
		} else {
			const auto b = static_cast<unsigned char>(ch);
			dest.push_back('%');
			dest.push_back(hex_digits[b >> 4]);
			dest.push_back(hex_digits[b & 0xf]);
		}
	}
}

std::string
UriEscape(std::string_view src, std::string_view keep)
{
	std::string result;
	UriEscapeAppend(result, src, keep);
	return result;
}
