// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "ObjectStream.hxx"

#include <filesystem>
#include <string>

namespace S3 {

struct Config {
	/**
	 * The URI of the bucket, e.g.
	 * "https://bucket.s3.eu-central-1.amazonaws.com".
	 */
	std::string bucket_uri;

	/**
	 * Credentials for AWS Signature V4.  Either all of them are
	 * set or none; in the latter case, requests are anonymous.
	 */
	std::string access_key, secret_key, region;

	FetchOptions fetch;

	bool HasCredentials() const noexcept {
		return !access_key.empty();
	}

	/**
	 * Return a copy which can be logged, i.e. with all secrets
	 * replaced.
	 */
	Config Redacted() const;

	/**
	 * Throws std::runtime_error if the configuration is
	 * incomplete.
	 */
	void Check() const;
};

/**
 * Load a #Config from a file.
 *
 * Throws on error.
 */
Config
LoadConfigFile(const std::filesystem::path &path);

} // namespace S3
