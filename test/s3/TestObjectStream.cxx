// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "FakeHttpClient.hxx"
#include "s3/ObjectStream.hxx"
#include "s3/Error.hxx"
#include "util/Exception.hxx"
#include "util/SpanCast.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

static constexpr auto BUCKET_URI = "https://bucket.example.com"sv;

static S3::ObjectStream
Open(FakeHttpClient &client, std::string_view path,
     const S3::FetchOptions &options={})
{
	return RunSync(S3::OpenObject(client, BUCKET_URI, path, options));
}

/**
 * Read one chunk and append it to the given string.
 *
 * @return false at the end of the object
 */
static bool
ReadChunk(S3::ObjectStream &stream, std::string &dest)
{
	const auto data = RunSync(stream.Read());
	dest.append(ToStringView(data));
	return !data.empty();
}

static std::string
ReadAll(S3::ObjectStream &stream)
{
	std::string result;
	while (ReadChunk(stream, result)) {}
	return result;
}

static const std::string *
FindRequestHeader(const S3::HttpRequest &request, std::string_view name)
{
	return S3::FindHeader(request.headers, name);
}

static void
ExpectRangeFrom(const S3::HttpRequest &request, std::string_view expected)
{
	const auto *range = FindRequestHeader(request, "range"sv);
	ASSERT_NE(range, nullptr);
	EXPECT_EQ(*range, expected);
}

TEST(ObjectStream, Complete)
{
	const auto contents = MakeContents(10000);

	FakeHttpClient client;
	client.Add(MakeFullResponse(contents, contents.size(),
				    FakeResponse::Ending::END));

	auto stream = Open(client, "/a/b.json"sv);
	EXPECT_EQ(ReadAll(stream), contents);
	EXPECT_EQ(stream.GetPosition(), contents.size());
	EXPECT_EQ(client.open_bodies, 0u);

	ASSERT_EQ(client.requests.size(), 1u);
	EXPECT_EQ(client.requests.front().uri,
		  "https://bucket.example.com/a/b.json");
	EXPECT_EQ(FindRequestHeader(client.requests.front(), "range"sv), nullptr);

	/* further reads keep reporting the end */
	std::string more;
	EXPECT_FALSE(ReadChunk(stream, more));
	EXPECT_EQ(client.requests.size(), 1u);
}

TEST(ObjectStream, EscapedKey)
{
	FakeHttpClient client;
	client.Add(MakeFullResponse("x", 1, FakeResponse::Ending::END));

	auto stream = Open(client, "//dir/a b+c.json"sv);
	EXPECT_EQ(ReadAll(stream), "x");

	ASSERT_EQ(client.requests.size(), 1u);
	EXPECT_EQ(client.requests.front().uri,
		  "https://bucket.example.com/dir/a%20b%2Bc.json");
}

TEST(ObjectStream, TransportInterruption)
{
	const auto contents = MakeContents(10000);

	FakeHttpClient client;
	client.Add(MakeFullResponse(contents, 4096,
				    FakeResponse::Ending::INTERRUPTED));
	client.Add(MakePartialResponse(contents, 4096));

	auto stream = Open(client, "/a/b.json"sv);
	EXPECT_EQ(ReadAll(stream), contents);
	EXPECT_EQ(stream.GetPosition(), 10000u);
	EXPECT_EQ(stream.GetAttemptCount(), 2u);
	EXPECT_EQ(client.open_bodies, 0u);

	ASSERT_EQ(client.requests.size(), 2u);
	ExpectRangeFrom(client.requests[1], "bytes=4096-"sv);
	EXPECT_EQ(client.requests[1].uri, client.requests[0].uri);
}

TEST(ObjectStream, ResumeAtZero)
{
	const auto contents = MakeContents(10000);

	/* the connection drops right after the response headers */
	FakeHttpClient client;
	client.Add(MakeFullResponse(contents, 0,
				    FakeResponse::Ending::INTERRUPTED));
	client.Add(MakePartialResponse(contents, 0));

	auto stream = Open(client, "/a/b.json"sv);
	EXPECT_EQ(ReadAll(stream), contents);
	EXPECT_EQ(stream.GetPosition(), 10000u);
	EXPECT_EQ(stream.GetAttemptCount(), 2u);
	EXPECT_EQ(client.open_bodies, 0u);

	ASSERT_EQ(client.requests.size(), 2u);
	ExpectRangeFrom(client.requests[1], "bytes=0-"sv);
}

TEST(ObjectStream, InterruptBeforeFirstRead)
{
	const auto contents = MakeContents(10000);

	FakeHttpClient client;
	client.Add(MakeFullResponse(contents, contents.size(),
				    FakeResponse::Ending::END));
	client.Add(MakePartialResponse(contents, 0));

	auto stream = Open(client, "/a/b.json"sv);
	EXPECT_EQ(client.open_bodies, 1u);

	stream.Interrupt();
	EXPECT_EQ(client.open_bodies, 0u);
	EXPECT_EQ(stream.GetPosition(), 0u);

	EXPECT_EQ(ReadAll(stream), contents);
	EXPECT_EQ(client.open_bodies, 0u);

	ASSERT_EQ(client.requests.size(), 2u);
	ExpectRangeFrom(client.requests[1], "bytes=0-"sv);
}

TEST(ObjectStream, ConsumerInterrupt)
{
	const auto contents = MakeContents(10000);

	FakeHttpClient client;
	client.Add(MakeFullResponse(contents, contents.size(),
				    FakeResponse::Ending::END));
	client.Add(MakePartialResponse(contents, 4096));

	auto stream = Open(client, "/a/b.json"sv);

	std::string result;
	while (stream.GetPosition() < 4096)
		ASSERT_TRUE(ReadChunk(stream, result));

	ASSERT_EQ(stream.GetPosition(), 4096u);
	EXPECT_EQ(client.open_bodies, 1u);

	stream.Interrupt();
	EXPECT_EQ(client.open_bodies, 0u);
	EXPECT_EQ(client.requests.size(), 1u);

	while (ReadChunk(stream, result)) {}

	EXPECT_EQ(result, contents);

	ASSERT_EQ(client.requests.size(), 2u);
	ExpectRangeFrom(client.requests[1], "bytes=4096-"sv);
}

TEST(ObjectStream, CancelPendingRead)
{
	const auto contents = MakeContents(10000);

	FakeHttpClient client;
	client.Add(MakeFullResponse(contents, 3000,
				    FakeResponse::Ending::PAUSE));
	client.Add(MakePartialResponse(contents, 3000));

	auto stream = Open(client, "/a/b.json"sv);

	std::string result;
	while (stream.GetPosition() < 3000)
		ASSERT_TRUE(ReadChunk(stream, result));

	{
		/* this read blocks; abandon it */
		auto read = stream.Read();
		std::optional<std::span<const std::byte>> data;
		auto invoke = AwaitInto(read, data);

		Completion c;
		c.Start(invoke);
		ASSERT_FALSE(c.done);
		EXPECT_EQ(client.open_bodies, 1u);
	}

	EXPECT_EQ(client.open_bodies, 0u);
	EXPECT_EQ(stream.GetPosition(), 3000u);

	while (ReadChunk(stream, result)) {}
	EXPECT_EQ(result, contents);

	ASSERT_EQ(client.requests.size(), 2u);
	ExpectRangeFrom(client.requests[1], "bytes=3000-"sv);
}

TEST(ObjectStream, InterruptAfterLastByte)
{
	const auto contents = MakeContents(2048);

	FakeHttpClient client;
	client.Add(MakeFullResponse(contents, contents.size(),
				    FakeResponse::Ending::END));

	auto stream = Open(client, "/a/b.json"sv);

	std::string result;
	while (stream.GetPosition() < contents.size())
		ASSERT_TRUE(ReadChunk(stream, result));

	stream.Interrupt();

	/* the announced size has been delivered; no need for
	   another request */
	EXPECT_FALSE(ReadChunk(stream, result));
	EXPECT_EQ(result, contents);
	EXPECT_EQ(client.requests.size(), 1u);
}

TEST(ObjectStream, WholeObjectOnResume)
{
	const auto contents = MakeContents(10000);

	FakeHttpClient client;
	client.Add(MakeFullResponse(contents, 4000,
				    FakeResponse::Ending::INTERRUPTED));

	/* the server ignores the "Range" header */
	client.Add(MakeFullResponse(contents, contents.size(),
				    FakeResponse::Ending::END));

	auto stream = Open(client, "/a/b.json"sv);
	EXPECT_EQ(ReadAll(stream), contents);
	EXPECT_EQ(client.requests.size(), 2u);
}

TEST(ObjectStream, IfMatch)
{
	const auto contents = MakeContents(10000);

	FakeHttpClient client;
	auto first = MakeFullResponse(contents, 4096,
				      FakeResponse::Ending::INTERRUPTED);
	first.headers.emplace("etag", "\"abc\"");
	client.Add(std::move(first));
	client.Add(MakePartialResponse(contents, 4096));

	auto stream = Open(client, "/a/b.json"sv);
	EXPECT_EQ(ReadAll(stream), contents);

	ASSERT_EQ(client.requests.size(), 2u);
	EXPECT_EQ(FindRequestHeader(client.requests[0], "if-match"sv), nullptr);

	const auto *if_match = FindRequestHeader(client.requests[1], "if-match"sv);
	ASSERT_NE(if_match, nullptr);
	EXPECT_EQ(*if_match, "\"abc\"");
}

TEST(ObjectStream, ObjectReplaced)
{
	const auto contents = MakeContents(10000);

	FakeHttpClient client;
	auto first = MakeFullResponse(contents, 4096,
				      FakeResponse::Ending::INTERRUPTED);
	first.headers.emplace("etag", "\"abc\"");
	client.Add(std::move(first));
	client.Add(MakeStatusResponse(HttpStatus::PRECONDITION_FAILED));

	auto stream = Open(client, "/a/b.json"sv);

	std::string result;
	try {
		while (ReadChunk(stream, result)) {}
		FAIL() << "Exception expected";
	} catch (const S3::ObjectError &e) {
		EXPECT_EQ(e.GetCode(), S3::ObjectErrorCode::UNEXPECTED_STATUS);
		EXPECT_EQ(e.GetStatus(), HttpStatus::PRECONDITION_FAILED);
	}

	EXPECT_EQ(result, contents.substr(0, 4096));
}

TEST(ObjectStream, NotFound)
{
	FakeHttpClient client;
	client.Add(MakeStatusResponse(HttpStatus::NOT_FOUND));

	try {
		Open(client, "/a/b.json"sv);
		FAIL() << "Exception expected";
	} catch (const S3::ObjectError &e) {
		EXPECT_EQ(e.GetCode(), S3::ObjectErrorCode::NOT_FOUND);
		EXPECT_EQ(e.GetPath(), "/a/b.json");
		EXPECT_EQ(e.GetStatus(), HttpStatus::NOT_FOUND);
	}

	EXPECT_EQ(client.requests.size(), 1u);
	EXPECT_EQ(client.open_bodies, 0u);
}

TEST(ObjectStream, NotFoundOnResume)
{
	const auto contents = MakeContents(10000);

	FakeHttpClient client;
	client.Add(MakeFullResponse(contents, 4096,
				    FakeResponse::Ending::INTERRUPTED));
	client.Add(MakeStatusResponse(HttpStatus::NOT_FOUND));

	auto stream = Open(client, "/a/b.json"sv);

	std::string result;
	try {
		while (ReadChunk(stream, result)) {}
		FAIL() << "Exception expected";
	} catch (const S3::ObjectError &e) {
		EXPECT_EQ(e.GetCode(), S3::ObjectErrorCode::NOT_FOUND);
	}

	EXPECT_EQ(result.size(), 4096u);
	EXPECT_EQ(stream.GetPosition(), 4096u);

	/* the error is sticky */
	try {
		ReadChunk(stream, result);
		FAIL() << "Exception expected";
	} catch (const S3::ObjectError &e) {
		EXPECT_EQ(e.GetCode(), S3::ObjectErrorCode::NOT_FOUND);
	}

	EXPECT_EQ(client.requests.size(), 2u);
}

TEST(ObjectStream, AccessDeniedOnResume)
{
	const auto contents = MakeContents(10000);

	FakeHttpClient client;
	client.Add(MakeFullResponse(contents, 4096,
				    FakeResponse::Ending::INTERRUPTED));
	client.Add(MakeStatusResponse(HttpStatus::FORBIDDEN));

	auto stream = Open(client, "/a/b.json"sv);

	std::string result;
	try {
		while (ReadChunk(stream, result)) {}
		FAIL() << "Exception expected";
	} catch (const S3::ObjectError &e) {
		EXPECT_EQ(e.GetCode(), S3::ObjectErrorCode::ACCESS_DENIED);
		EXPECT_EQ(e.GetPath(), "/a/b.json");
	}

	EXPECT_EQ(result, contents.substr(0, 4096));
	EXPECT_EQ(stream.GetPosition(), 4096u);
	EXPECT_EQ(client.open_bodies, 0u);
	EXPECT_EQ(client.requests.size(), 2u);
}

TEST(ObjectStream, AccessDenied)
{
	FakeHttpClient client;
	client.Add(MakeStatusResponse(HttpStatus::FORBIDDEN));

	try {
		Open(client, "/secret"sv);
		FAIL() << "Exception expected";
	} catch (const S3::ObjectError &e) {
		EXPECT_EQ(e.GetCode(), S3::ObjectErrorCode::ACCESS_DENIED);
		EXPECT_EQ(e.GetPath(), "/secret");
	}
}

TEST(ObjectStream, UnexpectedStatus)
{
	FakeHttpClient client;
	client.Add(MakeStatusResponse(HttpStatus::INTERNAL_SERVER_ERROR));

	try {
		Open(client, "/a/b.json"sv);
		FAIL() << "Exception expected";
	} catch (const S3::ObjectError &e) {
		EXPECT_EQ(e.GetCode(), S3::ObjectErrorCode::UNEXPECTED_STATUS);
		EXPECT_EQ(e.GetStatus(), HttpStatus::INTERNAL_SERVER_ERROR);
	}
}

TEST(ObjectStream, PartialContentWithoutRange)
{
	const auto contents = MakeContents(100);

	FakeHttpClient client;
	client.Add(MakePartialResponse(contents, 0));

	try {
		Open(client, "/a/b.json"sv);
		FAIL() << "Exception expected";
	} catch (const S3::ObjectError &e) {
		EXPECT_EQ(e.GetCode(), S3::ObjectErrorCode::UNEXPECTED_STATUS);
	}
}

TEST(ObjectStream, TransportError)
{
	const auto contents = MakeContents(10000);

	FakeHttpClient client;
	client.Add(MakeFullResponse(contents, 3000,
				    FakeResponse::Ending::ERROR));

	auto stream = Open(client, "/a/b.json"sv);

	std::string result;
	try {
		while (ReadChunk(stream, result)) {}
		FAIL() << "Exception expected";
	} catch (const S3::ObjectError &e) {
		EXPECT_EQ(e.GetCode(), S3::ObjectErrorCode::CONNECTION_FAILED);
		EXPECT_EQ(e.GetPath(), "/a/b.json");

		const auto msg = GetFullMessage(std::current_exception());
		EXPECT_NE(msg.find("Unexpected response stream termination"),
			  msg.npos);
		EXPECT_NE(msg.find("Connection reset by peer"), msg.npos);
	}

	EXPECT_EQ(result, contents.substr(0, 3000));
	EXPECT_EQ(stream.GetPosition(), 3000u);

	/* no further request */
	EXPECT_EQ(client.requests.size(), 1u);
	EXPECT_EQ(client.open_bodies, 0u);
}

TEST(ObjectStream, RequestFailed)
{
	/* no scripted response: the fake client throws */
	FakeHttpClient client;

	try {
		Open(client, "/a/b.json"sv);
		FAIL() << "Exception expected";
	} catch (const S3::ObjectError &e) {
		EXPECT_EQ(e.GetCode(), S3::ObjectErrorCode::CONNECTION_FAILED);
	}
}

TEST(ObjectStream, ResumeLimit)
{
	const auto contents = MakeContents(10000);

	FakeHttpClient client;
	client.Add(MakeFullResponse(contents, 1000,
				    FakeResponse::Ending::INTERRUPTED));
	client.Add(MakePartialResponse(contents, 1000, 1000,
				       FakeResponse::Ending::INTERRUPTED));
	client.Add(MakePartialResponse(contents, 2000, 1000,
				       FakeResponse::Ending::INTERRUPTED));
	client.Add(MakePartialResponse(contents, 3000));

	auto stream = Open(client, "/a/b.json"sv,
			   S3::FetchOptions{.max_resume_attempts = 2});

	std::string result;
	try {
		while (ReadChunk(stream, result)) {}
		FAIL() << "Exception expected";
	} catch (const S3::ObjectError &e) {
		EXPECT_EQ(e.GetCode(), S3::ObjectErrorCode::CONNECTION_FAILED);
	}

	EXPECT_EQ(result, contents.substr(0, 3000));
	EXPECT_EQ(client.requests.size(), 3u);
	EXPECT_EQ(client.open_bodies, 0u);
}

TEST(ObjectStream, ResumeDisabled)
{
	const auto contents = MakeContents(10000);

	FakeHttpClient client;
	client.Add(MakeFullResponse(contents, 1000,
				    FakeResponse::Ending::INTERRUPTED));

	auto stream = Open(client, "/a/b.json"sv,
			   S3::FetchOptions{.max_resume_attempts = 0});

	std::string result;
	try {
		while (ReadChunk(stream, result)) {}
		FAIL() << "Exception expected";
	} catch (const S3::ObjectError &e) {
		EXPECT_EQ(e.GetCode(), S3::ObjectErrorCode::CONNECTION_FAILED);
	}

	EXPECT_EQ(client.requests.size(), 1u);
}

TEST(ObjectStream, ContentRangeMismatch)
{
	const auto contents = MakeContents(10000);

	FakeHttpClient client;
	client.Add(MakeFullResponse(contents, 4096,
				    FakeResponse::Ending::INTERRUPTED));
	client.Add(MakePartialResponse(contents, 0));

	auto stream = Open(client, "/a/b.json"sv);

	std::string result;
	try {
		while (ReadChunk(stream, result)) {}
		FAIL() << "Exception expected";
	} catch (const S3::ObjectError &e) {
		EXPECT_EQ(e.GetCode(), S3::ObjectErrorCode::CONNECTION_FAILED);
	}

	EXPECT_EQ(result, contents.substr(0, 4096));
	EXPECT_EQ(client.open_bodies, 0u);
}

TEST(ObjectStream, DestroyReleasesConnection)
{
	const auto contents = MakeContents(10000);

	FakeHttpClient client;
	client.Add(MakeFullResponse(contents, contents.size(),
				    FakeResponse::Ending::END));

	{
		auto stream = Open(client, "/a/b.json"sv);
		EXPECT_EQ(client.open_bodies, 1u);

		std::string result;
		ASSERT_TRUE(ReadChunk(stream, result));
		EXPECT_EQ(client.open_bodies, 1u);
	}

	EXPECT_EQ(client.open_bodies, 0u);
	EXPECT_EQ(client.requests.size(), 1u);
}
