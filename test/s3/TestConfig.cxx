// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "s3/Config.hxx"
#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <system_error>

#include <unistd.h>

/**
 * A temporary file which is deleted by the destructor.
 */
class TempConfigFile {
	std::filesystem::path path;

public:
	explicit TempConfigFile(const char *contents)
		:path(std::filesystem::temp_directory_path() /
		      ("TestConfig." + std::to_string(getpid()) + ".conf"))
	{
		std::ofstream f{path};
		f << contents;
	}

	~TempConfigFile() noexcept {
		std::error_code ec;
		std::filesystem::remove(path, ec);
	}

	TempConfigFile(const TempConfigFile &) = delete;
	TempConfigFile &operator=(const TempConfigFile &) = delete;

	const std::filesystem::path &GetPath() const noexcept {
		return path;
	}
};

static std::string
LoadError(const char *contents)
{
	const TempConfigFile file{contents};

	try {
		S3::LoadConfigFile(file.GetPath());
	} catch (...) {
		return GetFullMessage(std::current_exception());
	}

	return {};
}

TEST(Config, Full)
{
	const TempConfigFile file{
		"# comment\n"
		"\n"
		"bucket_uri \"https://bucket.s3.eu-central-1.amazonaws.com\"\n"
		"  access_key AKIAEXAMPLE\n"
		"secret_key \"s3cr3t/+key\"\n"
		"region eu-central-1\n"
		"max_resume_attempts 3\n"
	};

	const auto config = S3::LoadConfigFile(file.GetPath());
	EXPECT_EQ(config.bucket_uri, "https://bucket.s3.eu-central-1.amazonaws.com");
	EXPECT_EQ(config.access_key, "AKIAEXAMPLE");
	EXPECT_EQ(config.secret_key, "s3cr3t/+key");
	EXPECT_EQ(config.region, "eu-central-1");
	EXPECT_EQ(config.fetch.max_resume_attempts, 3u);
	EXPECT_TRUE(config.HasCredentials());
}

TEST(Config, Anonymous)
{
	const TempConfigFile file{"bucket_uri 'http://localhost:9000/bucket'\n"};

	const auto config = S3::LoadConfigFile(file.GetPath());
	EXPECT_EQ(config.bucket_uri, "http://localhost:9000/bucket");
	EXPECT_FALSE(config.HasCredentials());
	EXPECT_EQ(config.fetch.max_resume_attempts,
		  S3::FetchOptions{}.max_resume_attempts);
}

TEST(Config, Redacted)
{
	S3::Config config;
	config.bucket_uri = "https://bucket.example.com";
	config.access_key = "AKIAEXAMPLE";
	config.secret_key = "secret";
	config.region = "us-east-1";

	const auto r = config.Redacted();
	EXPECT_EQ(r.bucket_uri, config.bucket_uri);
	EXPECT_EQ(r.access_key, "<REDACTED>");
	EXPECT_EQ(r.secret_key, "<REDACTED>");
	EXPECT_EQ(r.region, config.region);

	/* the original is unchanged */
	EXPECT_EQ(config.secret_key, "secret");

	/* nothing to hide */
	const auto anonymous = S3::Config{.bucket_uri = "http://b"}.Redacted();
	EXPECT_TRUE(anonymous.access_key.empty());
	EXPECT_TRUE(anonymous.secret_key.empty());
}

TEST(Config, Errors)
{
	EXPECT_NE(LoadError("").find("Missing bucket_uri"), std::string::npos);

	const auto unknown = LoadError("bucket_uri 'http://b'\nfoo bar\n");
	EXPECT_NE(unknown.find(":2"), std::string::npos);
	EXPECT_NE(unknown.find("Unknown option"), std::string::npos);

	EXPECT_NE(LoadError("bucket_uri 'http://b'\naccess_key a\n").find("together"),
		  std::string::npos);

	EXPECT_NE(LoadError("bucket_uri 'http://b'\nmax_resume_attempts x\n").find("Number expected"),
		  std::string::npos);

	EXPECT_NE(LoadError("bucket_uri 'http://b' extra\n").find(":1"),
		  std::string::npos);
}

TEST(Config, MissingFile)
{
	EXPECT_THROW(S3::LoadConfigFile("/nonexistent/s3fetch.conf"),
		     std::system_error);
}
