// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "HttpClient.hxx"

namespace S3 {

const std::string *
FindHeader(const HttpHeaders &headers, std::string_view name) noexcept
{
	const auto i = headers.find(name);
	return i != headers.end()
		? &i->second
		: nullptr;
}

} // namespace S3
