// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "CountingBody.hxx"
#include "Progress.hxx"

#include <algorithm>
#include <cassert>

namespace S3 {

CountingBody::CountingBody(std::unique_ptr<HttpBody> _body,
			   std::shared_ptr<FetchProgress> _progress,
			   uint64_t _skip) noexcept
	:body(std::move(_body)), progress(std::move(_progress)),
	 skip(_skip)
{
	assert(body);
	assert(progress);
}

CountingBody::~CountingBody() noexcept
{
	Cancel();
}

void
CountingBody::Cancel() noexcept
{
	if (IsOpen())
		Finish(BodyExit::CANCELED);
}

void
CountingBody::Finish(BodyExit exit) noexcept
{
	assert(IsOpen());

	/* release the connection before anybody gets a chance to
	   start the next attempt */
	body.reset();

	progress->SetResumable(exit == BodyExit::CANCELED);
}

Co::Task<std::span<const std::byte>>
CountingBody::Read()
{
	assert(IsOpen());

	while (true) {
		HttpBodyChunk chunk;

		try {
			chunk = co_await body->Read();
		} catch (...) {
			Finish(BodyExit::ERROR);
			throw;
		}

		switch (chunk.type) {
		case HttpBodyChunk::Type::DATA:
			break;

		case HttpBodyChunk::Type::END:
			Finish(BodyExit::COMPLETED);
			co_return std::span<const std::byte>{};

		case HttpBodyChunk::Type::INTERRUPTED:
			Finish(BodyExit::CANCELED);
			co_return std::span<const std::byte>{};
		}

		auto data = chunk.data;

		if (skip > 0) {
			const std::size_t n = std::min<uint64_t>(skip, data.size());
			skip -= n;
			data = data.subspan(n);
		}

		if (data.empty())
			/* an empty span would look like the end of the
			   body to our caller */
			continue;

		progress->AddSeen(data.size());
		co_return data;
	}
}

} // namespace S3
