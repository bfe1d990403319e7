// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "HttpClient.hxx"

#include <string>

class CurlEasy;

namespace S3 {

struct Config;

/**
 * A #HttpClient implementation using libcurl.  Each request gets
 * its own connection which is driven only while the response body
 * is being read.
 *
 * The caller is responsible for initializing libcurl (see
 * #ScopeCurlInit).
 */
class CurlClient final : public HttpClient {
	/**
	 * The CURLOPT_AWS_SIGV4 value; empty if requests are not
	 * signed.
	 */
	std::string aws_sigv4;

	std::string access_key, secret_key;

public:
	explicit CurlClient(const Config &config);

	/**
	 * Apply the options of this client (e.g. request signing) to
	 * a new transfer.
	 */
	void Setup(CurlEasy &easy) const;

	/* virtual methods from class HttpClient */
	Co::Task<HttpResponse> Get(HttpRequest request) override;
};

} // namespace S3
