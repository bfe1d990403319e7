// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Error.hxx"

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

namespace Curl {

Error
MakeError(CURLcode code, const char *prefix,
	  const char *error_buffer) noexcept
{
	const char *msg = error_buffer != nullptr && *error_buffer != 0
		? error_buffer
		: curl_easy_strerror(code);

	return {code, fmt::format("{}: {}"sv, prefix, msg)};
}

} // namespace Curl
