// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "http/Status.hxx"

#include <fmt/format.h>

/**
 * Formats a #HttpStatus as its numeric code.
 */
template<>
struct fmt::formatter<HttpStatus> : formatter<unsigned>
{
	template<typename FormatContext>
	auto format(HttpStatus status, FormatContext &ctx) const {
		return formatter<unsigned>::format(static_cast<unsigned>(status), ctx);
	}
};
