// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "RuleFile.hxx"
#include "RuleSet.hxx"
#include "UTF8.hxx"
#include "io/LineParser.hxx"

#include <fmt/format.h>

/**
 * Parse a quoted value which must contain exactly one (UTF-8)
 * character.
 */
static char32_t
ExpectSingleChar(LineParser &line)
{
	const std::string_view value = line.ExpectUnescape();

	const auto [ch, length] = DecodeUTF8(value);
	if (length == 0 || length != value.size())
		throw LineParser::Error("Single character expected");

	return ch;
}

void
RuleFileParser::ParseLine(LineParser &line)
{
	if (line.SkipWord("escape_char")) {
		if (have_escape_char)
			throw LineParser::Error("Duplicate escape_char");

		rule_set.SetEscapeChar(ExpectSingleChar(line));
		line.ExpectEnd();
		have_escape_char = true;
	} else if (line.SkipWord("rule")) {
		const char32_t raw = ExpectSingleChar(line);
		const char32_t escaped = ExpectSingleChar(line);
		line.ExpectEnd();

		rule_set.Add(raw, escaped);
	} else if (line.SkipWord("implicit_self_rule")) {
		implicit_self_rule = line.NextBool();
		line.ExpectEnd();
	} else {
		const char *word = line.ExpectWord();
		throw LineParser::Error(fmt::format("Unknown option: {}", word));
	}
}

void
RuleFileParser::Finish()
{
	if (implicit_self_rule)
		rule_set.AddSelfRule();

	ConfigParser::Finish();
}

RuleSet
LoadRuleFile(const boost::filesystem::path &path)
{
	RuleSet rule_set;
	RuleFileParser parser(rule_set);
	CommentConfigParser parser2(parser);
	ParseConfigFile(path, parser2);
	return rule_set;
}

RuleSet
ParseRuleString(const char *name, std::string_view src)
{
	RuleSet rule_set;
	RuleFileParser parser(rule_set);
	CommentConfigParser parser2(parser);
	ParseConfigString(name, src, parser2);
	return rule_set;
}
