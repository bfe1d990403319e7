// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "CurlClient.hxx"
#include "Config.hxx"
#include "lib/curl/Adapter.hxx"
#include "lib/curl/Easy.hxx"
#include "lib/curl/Handler.hxx"
#include "lib/curl/Multi.hxx"
#include "lib/curl/Setup.hxx"
#include "lib/curl/Slist.hxx"
#include "http/Status.hxx"

#include <fmt/core.h>

#include <cassert>
#include <stdexcept>
#include <vector>

using std::string_view_literals::operator""sv;

namespace S3 {

/**
 * One transfer.  It lives in its own "multi" handle which is only
 * driven from inside Read(); while nobody reads, the kernel's socket
 * buffer fills up and TCP flow control throttles the server.
 */
class CurlBody final : public HttpBody, CurlResponseHandler {
	CurlMulti multi;
	CurlEasy easy;
	CurlSlist request_headers;
	CurlResponseHandlerAdapter adapter{*this};

	HttpStatus status = HttpStatus::UNDEFINED;
	Curl::Headers headers;
	bool have_headers = false;

	/**
	 * Data received by the write callback which has not yet
	 * been returned by Read().
	 */
	std::vector<std::byte> pending;

	/**
	 * The chunk most recently returned by Read().
	 */
	std::vector<std::byte> current;

	enum class State {
		RUNNING,
		END,
		INTERRUPTED,
		ERROR,
	} state = State::RUNNING;

	std::exception_ptr error;

public:
	CurlBody(const CurlClient &client, const HttpRequest &request);

	~CurlBody() noexcept override {
		multi.Remove(easy);
	}

	CurlBody(const CurlBody &) = delete;
	CurlBody &operator=(const CurlBody &) = delete;

	/**
	 * Drive the transfer until the response headers have been
	 * received.
	 *
	 * Throws on error.
	 */
	void WaitHeaders();

	HttpStatus GetStatus() const noexcept {
		return status;
	}

	Curl::Headers TakeHeaders() noexcept {
		return std::move(headers);
	}

	/* virtual methods from class HttpBody */
	Co::Task<HttpBodyChunk> Read() override;

private:
	/**
	 * Let libcurl do some work, and wait for socket events if
	 * it had nothing to do.
	 */
	void Step();

	/* virtual methods from class CurlResponseHandler */
	void OnHeaders(HttpStatus _status, Curl::Headers &&_headers) override {
		status = _status;
		headers = std::move(_headers);
		have_headers = true;
	}

	void OnData(std::span<const std::byte> data) override {
		pending.insert(pending.end(), data.begin(), data.end());
	}

	void OnEnd() override {
		state = State::END;
	}

	void OnError(std::exception_ptr e) noexcept override {
		state = State::ERROR;
		error = std::move(e);
	}
};

CurlBody::CurlBody(const CurlClient &client, const HttpRequest &request)
{
	Curl::Setup(easy);
	client.Setup(easy);
	adapter.Install(easy);

	easy.SetURL(request.uri.c_str());

	for (const auto &[name, value] : request.headers)
		request_headers.Append(fmt::format("{}: {}"sv, name, value).c_str());
	easy.SetRequestHeaders(request_headers.Get());

	multi.Add(easy);
}

void
CurlBody::Step()
{
	assert(state == State::RUNNING);

	const std::size_t old_size = pending.size();

	multi.Perform();

	while (const CURLMsg *msg = multi.InfoRead()) {
		if (msg->msg != CURLMSG_DONE)
			continue;

		if (msg->data.result == CURLE_PARTIAL_FILE) {
			/* the connection was closed before the
			   announced Content-Length was received */
			adapter.FlushHeaders();
			if (state == State::RUNNING)
				state = State::INTERRUPTED;
		} else
			adapter.Done(msg->data.result);
	}

	if (state == State::RUNNING && pending.size() == old_size)
		/* nothing happened; wait for the socket */
		multi.Poll(std::chrono::seconds{1});
}

void
CurlBody::WaitHeaders()
{
	while (!have_headers && state == State::RUNNING)
		Step();

	if (have_headers)
		return;

	if (state == State::ERROR)
		std::rethrow_exception(error);

	throw std::runtime_error("Connection closed before the response headers were received");
}

Co::Task<HttpBodyChunk>
CurlBody::Read()
{
	current.clear();

	while (pending.empty() && state == State::RUNNING)
		Step();

	if (!pending.empty()) {
		current.swap(pending);
		co_return HttpBodyChunk{HttpBodyChunk::Type::DATA, current};
	}

	assert(state != State::RUNNING);

	if (state == State::ERROR)
		std::rethrow_exception(error);

	co_return HttpBodyChunk{
		state == State::END
		? HttpBodyChunk::Type::END
		: HttpBodyChunk::Type::INTERRUPTED,
		{},
	};
}

CurlClient::CurlClient(const Config &config)
	:access_key(config.access_key), secret_key(config.secret_key)
{
	if (config.HasCredentials())
		aws_sigv4 = fmt::format("aws:amz:{}:s3"sv, config.region);
}

void
CurlClient::Setup(CurlEasy &easy) const
{
	if (aws_sigv4.empty())
		return;

	easy.SetAwsSigV4(aws_sigv4.c_str());
	easy.SetUserName(access_key.c_str());
	easy.SetPassword(secret_key.c_str());
}

Co::Task<HttpResponse>
CurlClient::Get(HttpRequest request)
{
	auto body = std::make_unique<CurlBody>(*this, request);
	body->WaitHeaders();

	HttpResponse response;
	response.status = body->GetStatus();
	response.headers = body->TakeHeaders();
	response.body = std::move(body);
	co_return response;
}

} // namespace S3
