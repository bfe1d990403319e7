// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ConfigParser.hxx"
#include "FileLineParser.hxx"

#include <fmt/format.h>

#include <fstream>
#include <string>
#include <system_error>

#include <errno.h>

using std::string_view_literals::operator""sv;

bool
ConfigParser::PreParseLine(FileLineParser &)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(FileLineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return ConfigParser::PreParseLine(line);
}

void
CommentConfigParser::ParseLine(FileLineParser &line)
{
	child.ParseLine(line);
}

void
CommentConfigParser::Finish()
{
	child.Finish();
	ConfigParser::Finish();
}

static void
ParseConfigFile(const std::filesystem::path &path, std::istream &reader,
		ConfigParser &parser)
{
	std::string buffer;

	unsigned i = 1;
	while (std::getline(reader, buffer)) {
		FileLineParser line_parser(path, buffer.data());

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (...) {
			std::throw_with_nested(LineParser::Error{fmt::format("{}:{}"sv,
									     path.native(), i)});
		}

		++i;
	}
}

void
ParseConfigFile(const std::filesystem::path &path, ConfigParser &parser)
{
	std::ifstream reader{path};
	if (!reader)
		throw std::system_error(errno, std::system_category(),
					fmt::format("Failed to open {}"sv,
						    path.native()));

	ParseConfigFile(path, reader, parser);
	parser.Finish();
}
