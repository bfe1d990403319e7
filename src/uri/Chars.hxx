// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * Character classes for URIs, see RFC 3986 2.
 */

#pragma once

#include "util/CharUtil.hxx"

/**
 * See RFC 3986 2.3.
 */
constexpr bool
IsUriUnreservedChar(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) || ch == '-' || ch == '.' || ch == '_' || ch == '~';
}
