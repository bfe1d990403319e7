// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "HttpClient.hxx"
#include "co/Task.hxx"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace S3 {

class FetchProgress;

/**
 * How the body of one attempt ended.
 */
enum class BodyExit : uint_least8_t {
	/**
	 * The body was read until its natural end.
	 */
	COMPLETED,

	/**
	 * The transport reported an error.
	 */
	ERROR,

	/**
	 * The body was abandoned before its end without an error;
	 * the fetch may resume from the first byte not yet
	 * forwarded.
	 */
	CANCELED,
};

/**
 * A pass-through for the #HttpBody of one attempt which accounts
 * every forwarded byte in a #FetchProgress.  When the body ends (or
 * this object is destroyed), the connection is released and the
 * "resumable" flag is updated according to the #BodyExit; this
 * happens exactly once.
 */
class CountingBody {
	std::unique_ptr<HttpBody> body;

	const std::shared_ptr<FetchProgress> progress;

	/**
	 * The number of bytes at the beginning of the body which
	 * have already been forwarded by a previous attempt and
	 * must be discarded.
	 */
	uint64_t skip;

public:
	CountingBody(std::unique_ptr<HttpBody> _body,
		     std::shared_ptr<FetchProgress> _progress,
		     uint64_t _skip=0) noexcept;

	~CountingBody() noexcept;

	CountingBody(const CountingBody &) = delete;
	CountingBody &operator=(const CountingBody &) = delete;

	/**
	 * Is the body still open, i.e. has it not ended yet?
	 */
	bool IsOpen() const noexcept {
		return body != nullptr;
	}

	/**
	 * Read the next chunk.  Returns an empty span when the body
	 * has ended (completed or interrupted); afterwards, this
	 * object must not be used anymore.
	 *
	 * Exceptions from the transport are rethrown after the body
	 * has been finished with #BodyExit::ERROR.
	 */
	Co::Task<std::span<const std::byte>> Read();

	/**
	 * Abandon the body; this finishes it with
	 * #BodyExit::CANCELED.
	 */
	void Cancel() noexcept;

private:
	void Finish(BodyExit exit) noexcept;
};

} // namespace S3
