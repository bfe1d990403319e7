// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ObjectStream.hxx"
#include "CountingBody.hxx"
#include "Error.hxx"
#include "Key.hxx"
#include "Progress.hxx"
#include "http/Range.hxx"
#include "util/CharUtil.hxx"

#include <fmt/core.h>

#include <cassert>

#include <stdlib.h>

using std::string_view_literals::operator""sv;

namespace S3 {

/**
 * Parse a "Content-Length" response header.
 *
 * @return the value or ~0 if the header is malformed
 */
[[gnu::pure]]
static uint64_t
ParseContentLength(const std::string &value) noexcept
{
	if (value.empty() || !IsDigitASCII(value.front()))
		return ~uint64_t{};

	char *endptr;
	const uint64_t result = strtoull(value.c_str(), &endptr, 10);
	if (*endptr != 0)
		return ~uint64_t{};

	return result;
}

ObjectStream::ObjectStream(HttpClient &_client, HttpRequest &&_request,
			   std::string_view _path,
			   const FetchOptions &options) noexcept
	:client(&_client), request(std::move(_request)),
	 path(_path), logger(_path),
	 progress(std::make_shared<FetchProgress>()),
	 max_resume_attempts(options.max_resume_attempts) {}

ObjectStream::ObjectStream(ObjectStream &&) noexcept = default;
ObjectStream &ObjectStream::operator=(ObjectStream &&) noexcept = default;
ObjectStream::~ObjectStream() noexcept = default;

Co::Task<ObjectStream>
ObjectStream::Open(HttpClient &client, HttpRequest request,
		   std::string path, FetchOptions options)
{
	ObjectStream stream(client, std::move(request), path, options);
	co_await stream.StartAttempt();
	co_return std::move(stream);
}

uint64_t
ObjectStream::GetPosition() const noexcept
{
	return progress->GetSeen();
}

uint64_t
ObjectStream::CheckResponse(const HttpResponse &response,
			    bool resuming, uint64_t offset) const
{
	switch (response.status) {
	case HttpStatus::OK:
		/* on a follow-up request, the server may ignore the
		   "Range" header and send the whole object; skip
		   what has already been delivered */
		return offset;

	case HttpStatus::PARTIAL_CONTENT:
		if (resuming) {
			const auto *content_range = response.GetHeader("content-range"sv);
			HttpContentRange range;
			if (content_range == nullptr ||
			    !range.Parse(content_range->c_str()))
				throw MakeConnectionFailedError(path, "Malformed Content-Range"sv);

			if (range.first != offset)
				throw MakeConnectionFailedError(path,
								fmt::format("Content-Range starts at {} instead of {}"sv,
									    range.first, offset));

			return 0;
		}

		/* we didn't ask for a range */
		break;

	case HttpStatus::NOT_FOUND:
		throw MakeNotFoundError(path);

	case HttpStatus::FORBIDDEN:
		throw MakeAccessDeniedError(path);

	default:
		break;
	}

	throw MakeUnexpectedStatusError(path, response.status);
}

Co::Task<void>
ObjectStream::StartAttempt()
{
	assert(!attempt);

	const uint64_t offset = progress->GetSeen();

	const bool resuming = n_attempts > 0;

	HttpRequest r = request;
	if (resuming) {
		r.headers.emplace("range", HttpFormatRangeFrom(offset));
		if (!etag.empty())
			r.headers.emplace("if-match", etag);
	}

	++n_attempts;

	HttpResponse response;
	try {
		response = co_await client->Get(std::move(r));
	} catch (...) {
		logger(3, "Request failed: ", std::current_exception());
		std::rethrow_exception(NestConnectionFailedError(path, "Request failed"sv));
	}

	uint64_t skip;
	try {
		skip = CheckResponse(response, resuming, offset);
	} catch (const ObjectError &e) {
		logger.Fmt(3, "Attempt {} failed: {}"sv, n_attempts, e.what());
		throw;
	}

	if (!resuming) {
		if (const auto *value = response.GetHeader("etag"sv))
			etag = *value;

		if (const auto *value = response.GetHeader("content-length"sv))
			size = ParseContentLength(*value);
	}

	attempt = std::make_unique<CountingBody>(std::move(response.body),
						 progress, skip);
}

/**
 * Abandons the current attempt if a ObjectStream::Read() call is
 * canceled by destroying its task.
 */
class PendingRead {
	ObjectStream &stream;
	bool finished = false;

public:
	explicit PendingRead(ObjectStream &_stream) noexcept
		:stream(_stream) {}

	~PendingRead() noexcept {
		if (!finished)
			stream.Interrupt();
	}

	PendingRead(const PendingRead &) = delete;
	PendingRead &operator=(const PendingRead &) = delete;

	void Finish() noexcept {
		finished = true;
	}
};

Co::Task<std::span<const std::byte>>
ObjectStream::Read()
{
	if (error)
		std::rethrow_exception(error);

	PendingRead pending(*this);

	while (true) {
		if (!attempt) {
			const auto p = progress->Load();
			if (!p.resumable || IsComplete(p.seen)) {
				/* end of object */
				pending.Finish();
				co_return std::span<const std::byte>{};
			}

			if (n_attempts > max_resume_attempts) {
				error = std::make_exception_ptr(MakeConnectionFailedError(path,
											  fmt::format("Giving up after {} resume attempts"sv,
												      n_attempts - 1)));
				std::rethrow_exception(error);
			}

			logger.Fmt(2, "Resuming at offset {}"sv, p.seen);

			try {
				co_await StartAttempt();
			} catch (...) {
				error = std::current_exception();
				throw;
			}
		}

		std::span<const std::byte> data;

		try {
			data = co_await attempt->Read();
		} catch (...) {
			attempt.reset();
			error = NestConnectionFailedError(path, "Unexpected response stream termination"sv);
			std::rethrow_exception(error);
		}

		if (!data.empty()) {
			pending.Finish();
			co_return data;
		}

		/* this attempt has ended; if it was interrupted, the
		   next iteration resumes */
		attempt.reset();
	}
}

void
ObjectStream::Interrupt() noexcept
{
	attempt.reset();
}

Co::Task<ObjectStream>
OpenObject(HttpClient &client, std::string_view bucket_uri,
	   std::string_view path, const FetchOptions &options)
{
	HttpRequest request;
	request.uri = ComposeObjectUri(bucket_uri, ObjectKey(path));

	return ObjectStream::Open(client, std::move(request),
				  std::string{path}, options);
}

} // namespace S3
