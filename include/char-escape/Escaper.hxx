// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Rule.hxx"

#include <algorithm>
#include <span>
#include <string>
#include <string_view>

namespace CharEscape {

/**
 * Escapes and unescapes strings according to a table of
 * #EscapeRule instances.  Each character which has a rule is
 * replaced with the escape character followed by the rule's
 * "escaped" character; all other characters are copied as-is.
 *
 * The rule table is not copied; it must outlive this object.  If
 * two rules have the same "raw" (or "escaped") character, the first
 * one wins.
 *
 * All methods are const and may be called from any number of
 * threads concurrently.
 */
class Escaper {
	char32_t escape_char;
	std::span<const EscapeRule> rules;

	constexpr Escaper(std::span<const EscapeRule> _rules,
			  char32_t _escape_char) noexcept
		:escape_char(_escape_char), rules(_rules) {}

public:
	/**
	 * Throws #InvalidCharacterError if the escape character or a
	 * rule is not a Unicode scalar value, and
	 * #MissingEscapeCharRuleError if the table does not contain a
	 * rule for the escape character.
	 */
	Escaper(char32_t _escape_char, std::span<const EscapeRule> _rules);

	/**
	 * Construct without verifying the rules.  Escape() and
	 * Unescape() behave incorrectly if the table has no rule for
	 * the escape character or contains characters which are not
	 * Unicode scalar values; use this only for tables which are
	 * known to be valid, e.g. those built by MakeRuleTable().
	 */
	static constexpr Escaper Unchecked(char32_t _escape_char,
					   std::span<const EscapeRule> _rules) noexcept {
		return {_rules, _escape_char};
	}

	constexpr char32_t GetEscapeChar() const noexcept {
		return escape_char;
	}

	constexpr std::span<const EscapeRule> GetRules() const noexcept {
		return rules;
	}

	[[gnu::pure]]
	bool operator==(const Escaper &other) const noexcept {
		return escape_char == other.escape_char &&
			std::equal(rules.begin(), rules.end(),
				   other.rules.begin(), other.rules.end());
	}

	/**
	 * Returns a copy of the string with all characters escaped
	 * according to the rules.  The result always satisfies
	 * IsEscaped().
	 */
	std::u32string Escape(std::u32string_view s) const;

	/**
	 * Like Escape(std::u32string_view), but operates on UTF-8.
	 *
	 * Throws #MalformedUTF8Error on invalid input.
	 */
	std::string Escape(std::string_view s) const;

	/**
	 * Reverts what Escape() does.
	 *
	 * Throws #UnescapeError if the string contains an invalid
	 * escape sequence or ends with the escape character.
	 */
	std::u32string Unescape(std::u32string_view s) const;

	/**
	 * Like Unescape(std::u32string_view), but operates on UTF-8.
	 *
	 * Throws #MalformedUTF8Error on invalid input, #UnescapeError
	 * on bad escape sequences.
	 */
	std::string Unescape(std::string_view s) const;

	/**
	 * Could this string have been returned by Escape()?  That is
	 * the case if it contains only valid escape sequences, no
	 * character which needs to be escaped, and does not end with
	 * the escape character.  If this returns true, Unescape()
	 * will not throw.
	 */
	[[gnu::pure]]
	bool IsEscaped(std::u32string_view s) const noexcept;

	/**
	 * Like IsEscaped(std::u32string_view), but operates on UTF-8.
	 * Returns false if the string is not valid UTF-8.
	 */
	[[gnu::pure]]
	bool IsEscaped(std::string_view s) const noexcept;
};

} // namespace CharEscape
