// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ConfigParser.hxx"
#include "LineParser.hxx"

#include <fmt/format.h>

#include <exception>
#include <memory>
#include <string>
#include <system_error>

#include <errno.h>
#include <stdio.h>

bool
ConfigParser::PreParseLine([[maybe_unused]] LineParser &line)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(LineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return ConfigParser::PreParseLine(line);
}

void
CommentConfigParser::ParseLine(LineParser &line)
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
ParseConfigLine(std::string_view name, unsigned number, char *line,
		ConfigParser &parser)
{
	LineParser line_parser(line);

	try {
		if (!parser.PreParseLine(line_parser))
			parser.ParseLine(line_parser);
	} catch (...) {
		std::throw_with_nested(LineParser::Error(fmt::format("{}:{}",
								     name,
								     number)));
	}
}

static void
ParseConfigFile(const boost::filesystem::path &path, FILE *file,
		ConfigParser &parser)
{
	char buffer[4096], *line;
	unsigned i = 1;
	while ((line = fgets(buffer, sizeof(buffer), file)) != nullptr) {
		ParseConfigLine(path.native(), i, line, parser);
		++i;
	}

	if (ferror(file))
		throw std::system_error(errno, std::system_category(),
					fmt::format("Failed to read {}",
						    path.native()));
}

void
ParseConfigFile(const boost::filesystem::path &path, ConfigParser &parser)
{
	const std::unique_ptr<FILE, decltype(&fclose)>
		file(fopen(path.c_str(), "r"), fclose);
	if (!file)
		throw std::system_error(errno, std::system_category(),
					fmt::format("Failed to open {}",
						    path.native()));

	ParseConfigFile(path, file.get(), parser);
	parser.Finish();
}

void
ParseConfigString(const char *name, std::string_view src,
		  ConfigParser &parser)
{
	std::string buffer;

	unsigned i = 1;
	while (!src.empty()) {
		const auto newline = src.find('\n');
		const auto line = src.substr(0, newline);

		/* LineParser modifies the line in place */
		buffer.assign(line);
		ParseConfigLine(name, i, buffer.data(), parser);
		++i;

		if (newline == src.npos)
			break;

		src.remove_prefix(newline + 1);
	}

	parser.Finish();
}
