// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "HttpClient.hxx"
#include "co/Task.hxx"
#include "io/Logger.hxx"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace S3 {

class FetchProgress;
class CountingBody;

struct FetchOptions {
	/**
	 * The maximum number of follow-up requests after
	 * interruptions during one fetch.  0 disables resuming.
	 */
	unsigned max_resume_attempts = 16;
};

/**
 * The contents of one S3 object as a sequence of chunks.  If the
 * response body of a request is interrupted (by the transport or by
 * Interrupt()), the next Read() call sends a new request with a
 * "Range" header starting at the first byte which has not been
 * delivered yet; the consumer sees one uninterrupted sequence.
 *
 * At most one response body (i.e. one connection) is held at a
 * time; destroying this object releases it.
 *
 * Obtain an instance with OpenObject().
 */
class ObjectStream {
	HttpClient *client;

	/**
	 * The request of the first attempt; follow-up requests are
	 * derived from it.
	 */
	HttpRequest request;

	/**
	 * The logical path of the object, for error messages.
	 */
	std::string path;

	Logger logger;

	std::shared_ptr<FetchProgress> progress;

	/**
	 * The body of the current attempt; nullptr if it has ended.
	 */
	std::unique_ptr<CountingBody> attempt;

	/**
	 * The "ETag" of the first response; follow-up requests are
	 * made conditional on it, so they fail if the object has been
	 * replaced in the meantime.
	 */
	std::string etag;

	/**
	 * The size of the object according to the first response, or
	 * #UNKNOWN_SIZE.
	 */
	uint64_t size = UNKNOWN_SIZE;

	static constexpr uint64_t UNKNOWN_SIZE = ~uint64_t{};

	/**
	 * A terminal error which has been thrown by Read() before;
	 * it is rethrown by all further Read() calls.
	 */
	std::exception_ptr error;

	unsigned max_resume_attempts;

	unsigned n_attempts = 0;

	ObjectStream(HttpClient &_client, HttpRequest &&_request,
		     std::string_view _path,
		     const FetchOptions &options) noexcept;

public:
	ObjectStream(ObjectStream &&) noexcept;
	ObjectStream &operator=(ObjectStream &&) noexcept;
	~ObjectStream() noexcept;

	/**
	 * Send the first request.  This is an implementation detail
	 * of OpenObject().
	 */
	static Co::Task<ObjectStream> Open(HttpClient &client,
					   HttpRequest request,
					   std::string path,
					   FetchOptions options);

	const std::string &GetPath() const noexcept {
		return path;
	}

	/**
	 * The number of bytes which have been delivered so far.
	 */
	[[gnu::pure]]
	uint64_t GetPosition() const noexcept;

	/**
	 * The number of requests which have been sent so far.
	 */
	unsigned GetAttemptCount() const noexcept {
		return n_attempts;
	}

	/**
	 * Receive the next chunk of the object.  The returned span
	 * is valid until the next call.  An empty span means the
	 * object has been delivered completely.
	 *
	 * Destroying the returned task before it finishes abandons
	 * the current response body like Interrupt() does.
	 *
	 * Throws #ObjectError on failure.
	 */
	Co::Task<std::span<const std::byte>> Read();

	/**
	 * Abandon the current response body and release its
	 * connection.  The next Read() call resumes with a new
	 * request.
	 */
	void Interrupt() noexcept;

private:
	Co::Task<void> StartAttempt();

	/**
	 * Evaluate the response status of an attempt.
	 *
	 * @param resuming true if a "Range" was requested (which
	 * may start at offset 0)
	 * @param offset the first byte which was requested
	 * @return the number of bytes at the beginning of the body
	 * which must be skipped
	 */
	uint64_t CheckResponse(const HttpResponse &response,
			       bool resuming, uint64_t offset) const;

	/**
	 * Is the object known to be delivered completely?
	 */
	[[gnu::pure]]
	bool IsComplete(uint64_t seen) const noexcept {
		return size != UNKNOWN_SIZE && seen >= size;
	}
};

/**
 * Start fetching an object.  The first request is sent and its
 * response status evaluated before the returned task finishes.
 *
 * Throws #ObjectError if the object does not exist, access is
 * denied or the server responds with an unexpected status.
 *
 * @param client the HTTP client which sends the requests; it must
 * outlive the returned #ObjectStream
 * @param bucket_uri the URI of the bucket, e.g.
 * "https://bucket.s3.eu-central-1.amazonaws.com"
 * @param path the logical path of the object, e.g. "/a/b.json"
 */
Co::Task<ObjectStream>
OpenObject(HttpClient &client, std::string_view bucket_uri,
	   std::string_view path, const FetchOptions &options={});

} // namespace S3
