// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Config.hxx"
#include "io/config/ConfigParser.hxx"
#include "io/config/FileLineParser.hxx"

#include <stdexcept>
#include <string_view>

using std::string_view_literals::operator""sv;

namespace S3 {

static constexpr const char *REDACTED = "<REDACTED>";

Config
Config::Redacted() const
{
	Config result = *this;

	if (!result.access_key.empty())
		result.access_key = REDACTED;

	if (!result.secret_key.empty())
		result.secret_key = REDACTED;

	return result;
}

void
Config::Check() const
{
	if (bucket_uri.empty())
		throw std::runtime_error("Missing bucket_uri");

	if (access_key.empty() != secret_key.empty() ||
	    access_key.empty() != region.empty())
		throw std::runtime_error("access_key, secret_key and region must be specified together");
}

namespace {

class S3ConfigParser final : public ConfigParser {
	Config &config;

public:
	explicit S3ConfigParser(Config &_config) noexcept
		:config(_config) {}

	/* virtual methods from class ConfigParser */
	void ParseLine(FileLineParser &line) override;
	void Finish() override;
};

void
S3ConfigParser::ParseLine(FileLineParser &line)
{
	const std::string_view word = line.ExpectWord();

	if (word == "bucket_uri"sv)
		config.bucket_uri = line.ExpectValueAndEnd();
	else if (word == "access_key"sv)
		config.access_key = line.ExpectValueAndEnd();
	else if (word == "secret_key"sv)
		config.secret_key = line.ExpectValueAndEnd();
	else if (word == "region"sv)
		config.region = line.ExpectValueAndEnd();
	else if (word == "max_resume_attempts"sv) {
		config.fetch.max_resume_attempts = line.NextUnsigned();
		line.ExpectEnd();
	} else
		throw LineParser::Error("Unknown option");
}

void
S3ConfigParser::Finish()
{
	config.Check();
}

} // anonymous namespace

Config
LoadConfigFile(const std::filesystem::path &path)
{
	Config config;
	S3ConfigParser parser(config);
	CommentConfigParser comment_parser(parser);
	ParseConfigFile(path, comment_parser);
	return config;
}

} // namespace S3
