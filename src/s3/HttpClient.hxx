// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "co/Task.hxx"
#include "http/Status.hxx"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace S3 {

/**
 * HTTP header map; names are lower case.
 */
using HttpHeaders = std::multimap<std::string, std::string, std::less<>>;

[[gnu::pure]]
const std::string *
FindHeader(const HttpHeaders &headers, std::string_view name) noexcept;

/**
 * A GET request.
 */
struct HttpRequest {
	std::string uri;

	/**
	 * Additional request headers, e.g. "range".
	 */
	HttpHeaders headers;
};

struct HttpBodyChunk {
	enum class Type : uint_least8_t {
		/**
		 * #data contains the next portion of the body.
		 */
		DATA,

		/**
		 * The body has ended normally.
		 */
		END,

		/**
		 * The body was cut off without an error being
		 * reported, e.g. because the peer closed the
		 * connection before the announced length was
		 * transferred.
		 */
		INTERRUPTED,
	};

	Type type = Type::END;

	std::span<const std::byte> data;
};

/**
 * The body of one HTTP response.  The instance owns the connection
 * it is received on; destroying it releases the connection.
 */
class HttpBody {
public:
	virtual ~HttpBody() noexcept = default;

	/**
	 * Receive the next chunk.  #HttpBodyChunk::data remains valid
	 * until the next call or until this object is destroyed.
	 *
	 * Throws on transport errors.
	 */
	virtual Co::Task<HttpBodyChunk> Read() = 0;
};

struct HttpResponse {
	HttpStatus status = HttpStatus::UNDEFINED;

	HttpHeaders headers;

	std::unique_ptr<HttpBody> body;

	const std::string *GetHeader(std::string_view name) const noexcept {
		return FindHeader(headers, name);
	}
};

/**
 * The HTTP client which performs the requests of a fetch.  Request
 * signing and other transport details are up to the
 * implementation.
 */
class HttpClient {
public:
	virtual ~HttpClient() noexcept = default;

	/**
	 * Send a GET request and return as soon as the response
	 * headers have been received.
	 *
	 * Throws on transport errors.
	 */
	virtual Co::Task<HttpResponse> Get(HttpRequest request) = 0;
};

} // namespace S3
