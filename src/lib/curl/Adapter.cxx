// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Adapter.hxx"
#include "Handler.hxx"
#include "Easy.hxx"
#include "http/Status.hxx"
#include "util/CharUtil.hxx"
#include "util/StringStrip.hxx"

#include <cassert>

using std::string_view_literals::operator""sv;

CurlResponseHandlerAdapter::CurlResponseHandlerAdapter(CurlResponseHandler &_handler) noexcept
	:handler(_handler), status(HttpStatus::UNDEFINED)
{
	error_buffer[0] = 0;
}

void
CurlResponseHandlerAdapter::Install(CurlEasy &easy)
{
	easy.SetErrorBuffer(error_buffer);
	easy.SetHeaderFunction(_HeaderFunction, this);
	easy.SetWriteFunction(WriteFunction, this);
}

void
CurlResponseHandlerAdapter::FinishHeaders()
{
	if (state != State::HEADERS)
		return;

	state = State::BODY;
	handler.OnHeaders(status, std::move(headers));
}

/**
 * Parse the status code from a line like "HTTP/1.1 200 OK".
 */
static HttpStatus
ParseStatusLine(std::string_view line) noexcept
{
	const auto space = line.find(' ');
	if (space == line.npos)
		return HttpStatus::UNDEFINED;

	line = StripLeft(line.substr(space + 1));
	if (line.size() < 3 || !IsDigitASCII(line[0]) ||
	    !IsDigitASCII(line[1]) || !IsDigitASCII(line[2]))
		return HttpStatus::UNDEFINED;

	return static_cast<HttpStatus>((line[0] - '0') * 100 +
				       (line[1] - '0') * 10 +
				       (line[2] - '0'));
}

inline void
CurlResponseHandlerAdapter::HeaderFunction(std::string_view s)
{
	if (state != State::HEADERS)
		return;

	if (s.starts_with("HTTP/"sv)) {
		/* a new response begins; this happens after a
		   redirect, and the previous response's headers
		   are obsolete */
		headers.clear();
		status = ParseStatusLine(s);
		return;
	}

	const auto colon = s.find(':');
	if (colon == s.npos)
		/* the empty line after the headers */
		return;

	std::string name{Strip(s.substr(0, colon))};
	for (auto &ch : name)
		ch = ToLowerASCII(ch);

	headers.emplace(std::move(name),
			std::string{Strip(s.substr(colon + 1))});
}

std::size_t
CurlResponseHandlerAdapter::_HeaderFunction(char *ptr, std::size_t size,
					    std::size_t nmemb,
					    void *stream) noexcept
{
	auto &c = *(CurlResponseHandlerAdapter *)stream;

	size *= nmemb;

	try {
		c.HeaderFunction({ptr, size});
	} catch (...) {
		c.postponed_error = std::current_exception();
		/* returning a different size aborts the transfer */
		return 0;
	}

	return size;
}

inline std::size_t
CurlResponseHandlerAdapter::DataReceived(std::span<const std::byte> data) noexcept
{
	assert(state != State::CLOSED);

	try {
		FinishHeaders();
		handler.OnData(data);
	} catch (...) {
		postponed_error = std::current_exception();
		return 0;
	}

	return data.size();
}

std::size_t
CurlResponseHandlerAdapter::WriteFunction(char *ptr, std::size_t size,
					  std::size_t nmemb,
					  void *stream) noexcept
{
	auto &c = *(CurlResponseHandlerAdapter *)stream;

	size *= nmemb;
	if (size == 0)
		return 0;

	return c.DataReceived({(const std::byte *)ptr, size});
}

void
CurlResponseHandlerAdapter::Done(CURLcode result) noexcept
{
	if (state == State::CLOSED)
		return;

	if (postponed_error) {
		state = State::CLOSED;
		handler.OnError(std::move(postponed_error));
		return;
	}

	if (result != CURLE_OK) {
		state = State::CLOSED;
		handler.OnError(std::make_exception_ptr(Curl::MakeError(result, "CURL failed",
									 error_buffer)));
		return;
	}

	try {
		FinishHeaders();
		state = State::CLOSED;
		handler.OnEnd();
	} catch (...) {
		state = State::CLOSED;
		handler.OnError(std::current_exception());
	}
}

void
CurlResponseHandlerAdapter::FlushHeaders() noexcept
{
	if (state != State::HEADERS)
		return;

	if (postponed_error) {
		state = State::CLOSED;
		handler.OnError(std::move(postponed_error));
		return;
	}

	try {
		FinishHeaders();
	} catch (...) {
		state = State::CLOSED;
		handler.OnError(std::current_exception());
	}
}
