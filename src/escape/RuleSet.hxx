// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "char-escape/Error.hxx"
#include "char-escape/Escaper.hxx"
#include "char-escape/Table.hxx"

#include <vector>

/**
 * A rule table which owns its rules, e.g. one loaded from a rule
 * file.  Escapers created by MakeEscaper() refer to this object's
 * rule list and must not outlive it or survive a modification.
 */
class RuleSet {
	char32_t escape_char = CharEscape::DEFAULT_ESCAPE_CHAR;

	std::vector<CharEscape::EscapeRule> rules;

	static void Check(char32_t ch) {
		if (!CharEscape::IsUnicodeScalar(ch))
			throw CharEscape::InvalidCharacterError(ch);
	}

public:
	RuleSet() = default;

	char32_t GetEscapeChar() const noexcept {
		return escape_char;
	}

	/**
	 * Throws CharEscape::InvalidCharacterError if the character is
	 * not a Unicode scalar value.
	 */
	void SetEscapeChar(char32_t _escape_char) {
		Check(_escape_char);
		escape_char = _escape_char;
	}

	const std::vector<CharEscape::EscapeRule> &GetRules() const noexcept {
		return rules;
	}

	/**
	 * Throws CharEscape::InvalidCharacterError if one of the
	 * characters is not a Unicode scalar value.
	 */
	void Add(char32_t raw, char32_t escaped) {
		Check(raw);
		Check(escaped);
		rules.push_back({raw, escaped});
	}

	/**
	 * Append the rule which escapes the escape character with
	 * itself.  Rules added earlier take precedence.
	 */
	void AddSelfRule() {
		Add(escape_char, escape_char);
	}

	/**
	 * Throws CharEscape::MissingEscapeCharRuleError if there is no
	 * rule for the escape character.
	 */
	CharEscape::Escaper MakeEscaper() const {
		return {escape_char, rules};
	}
};
