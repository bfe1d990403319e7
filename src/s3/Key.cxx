// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Key.hxx"
#include "uri/Escape.hxx"

namespace S3 {

std::string_view
ObjectKey(std::string_view path) noexcept
{
	const auto i = path.find_first_not_of('/');
	return i == path.npos
		? std::string_view{}
		: path.substr(i);
}

std::string
ComposeObjectUri(std::string_view bucket_uri, std::string_view key)
{
	std::string uri{bucket_uri};
	if (uri.empty() || uri.back() != '/')
		uri.push_back('/');

	UriEscapeAppend(uri, key, "/");
	return uri;
}

} // namespace S3
