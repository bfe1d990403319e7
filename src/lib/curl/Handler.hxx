// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Headers.hxx"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <span>

enum class HttpStatus : uint_least16_t;

/**
 * Asynchronous response handler for a #CurlEasy transfer.
 */
class CurlResponseHandler {
public:
	/**
	 * The response headers have been received completely.  This
	 * is called at most once per transfer, after redirects have
	 * been followed.
	 */
	virtual void OnHeaders(HttpStatus status, Curl::Headers &&headers) = 0;

	/**
	 * Response body data has been received.
	 */
	virtual void OnData(std::span<const std::byte> data) = 0;

	/**
	 * The response has ended.
	 */
	virtual void OnEnd() = 0;

	/**
	 * An error has occurred.
	 */
	virtual void OnError(std::exception_ptr e) noexcept = 0;
};
