// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <boost/filesystem/path.hpp>

#include <string_view>

class LineParser;

class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	/**
	 * Gives the parser a chance to consume a line before
	 * ParseLine() is called.  Returns true if the line was
	 * consumed.
	 */
	virtual bool PreParseLine(LineParser &line);

	virtual void ParseLine(LineParser &line) = 0;
	virtual void Finish() {}
};

/**
 * A #ConfigParser which ignores empty lines and lines starting
 * with '#'.
 */
class CommentConfigParser final : public ConfigParser {
	ConfigParser &child;

public:
	explicit CommentConfigParser(ConfigParser &_child) noexcept
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(LineParser &line) override;
	void ParseLine(LineParser &line) override;
	void Finish() override;
};

/**
 * Feed each line of the file into the parser and call its Finish()
 * method at the end.  Errors are rethrown nested inside an
 * exception naming the file and line number.
 */
void
ParseConfigFile(const boost::filesystem::path &path, ConfigParser &parser);

/**
 * Like ParseConfigFile(), but read from a string.  The name is only
 * used in error messages.
 */
void
ParseConfigString(const char *name, std::string_view src,
		  ConfigParser &parser);
