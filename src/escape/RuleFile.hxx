// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

/*
 * Loading rule tables from configuration files.  Example:
 *
 *   # comment
 *   escape_char "\\"
 *   rule "\n" "n"
 *   rule " " "w"
 *   implicit_self_rule yes
 */

#pragma once

#include "io/ConfigParser.hxx"

#include <string_view>

class RuleSet;

class RuleFileParser final : public ConfigParser {
	RuleSet &rule_set;

	bool have_escape_char = false;

	/**
	 * Append the self-escaping rule in Finish()?
	 */
	bool implicit_self_rule = false;

public:
	explicit RuleFileParser(RuleSet &_rule_set) noexcept
		:rule_set(_rule_set) {}

	/* virtual methods from class ConfigParser */
	void ParseLine(LineParser &line) override;
	void Finish() override;
};

RuleSet
LoadRuleFile(const boost::filesystem::path &path);

/**
 * Parse rule file contents from memory.  The name is only used in
 * error messages.
 */
RuleSet
ParseRuleString(const char *name, std::string_view src);
