// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <string>
#include <string_view>

namespace S3 {

/**
 * Convert a logical object path (e.g. "/a/b.json") to an S3 object
 * key (e.g. "a/b.json") by removing leading slashes.
 */
[[gnu::pure]]
std::string_view
ObjectKey(std::string_view path) noexcept;

/**
 * Build the request URI for the given object key below a bucket
 * URI.  Every key byte except the unreserved characters and '/' is
 * percent-encoded.
 */
std::string
ComposeObjectUri(std::string_view bucket_uri, std::string_view key);

} // namespace S3
