// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

#include "Headers.hxx"

#include <curl/curl.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <span>
#include <string_view>

enum class HttpStatus : uint_least16_t;
class CurlEasy;
class CurlResponseHandler;

/**
 * Installs the libcurl header and write callbacks on a #CurlEasy
 * and translates them to #CurlResponseHandler calls.
 */
class CurlResponseHandlerAdapter {
	CurlResponseHandler &handler;

	Curl::Headers headers;

	/**
	 * An exception caught from a #CurlResponseHandler method
	 * invoked from a libcurl callback; it gets delivered by
	 * Done().
	 */
	std::exception_ptr postponed_error;

	HttpStatus status;

	enum class State {
		HEADERS,
		BODY,
		CLOSED,
	} state = State::HEADERS;

	char error_buffer[CURL_ERROR_SIZE];

public:
	explicit CurlResponseHandlerAdapter(CurlResponseHandler &_handler) noexcept;

	CurlResponseHandlerAdapter(const CurlResponseHandlerAdapter &) = delete;
	CurlResponseHandlerAdapter &operator=(const CurlResponseHandlerAdapter &) = delete;

	void Install(CurlEasy &easy);

	/**
	 * The transfer has finished; call OnEnd() or OnError().
	 */
	void Done(CURLcode result) noexcept;

	/**
	 * The transfer was cut off without an error (the peer closed
	 * the connection early).  Deliver the headers if that has not
	 * happened yet, but call neither OnEnd() nor OnError() unless
	 * the handler fails.
	 */
	void FlushHeaders() noexcept;

	const char *GetErrorBuffer() const noexcept {
		return error_buffer;
	}

private:
	void FinishHeaders();
	void HeaderFunction(std::string_view s);
	std::size_t DataReceived(std::span<const std::byte> data) noexcept;

	static std::size_t _HeaderFunction(char *ptr, std::size_t size,
					   std::size_t nmemb,
					   void *stream) noexcept;
	static std::size_t WriteFunction(char *ptr, std::size_t size,
					 std::size_t nmemb,
					 void *stream) noexcept;
};
