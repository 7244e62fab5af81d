// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <algorithm>
#include <span>

namespace CharEscape {

/**
 * Describes how one character is escaped: #raw is written as the
 * escape character followed by #escaped, and unescaping that pair
 * yields #raw again.
 */
struct EscapeRule {
	char32_t raw;
	char32_t escaped;

	constexpr bool operator==(const EscapeRule &) const noexcept = default;
};

/**
 * Is this a Unicode scalar value, i.e. a code point which may appear
 * in well-formed UTF-8 (no surrogate, not beyond U+10FFFF)?
 */
constexpr bool
IsUnicodeScalar(char32_t ch) noexcept
{
	return ch < 0xd800 || (ch > 0xdfff && ch <= 0x10ffff);
}

/**
 * Are the escape character and all characters in the rules Unicode
 * scalar values?
 */
constexpr bool
HasOnlyUnicodeScalars(char32_t escape_char,
		      std::span<const EscapeRule> rules) noexcept
{
	return IsUnicodeScalar(escape_char) &&
		std::all_of(rules.begin(), rules.end(),
			    [](const EscapeRule &rule){
				    return IsUnicodeScalar(rule.raw) &&
					    IsUnicodeScalar(rule.escaped);
			    });
}

/**
 * Does the table contain a rule which escapes the escape character
 * itself?  Without one, the escape character cannot appear literally
 * in unescaped text.
 */
constexpr bool
HasEscapeCharRule(char32_t escape_char,
		  std::span<const EscapeRule> rules) noexcept
{
	return std::any_of(rules.begin(), rules.end(),
			   [escape_char](const EscapeRule &rule){
				   return rule.raw == escape_char;
			   });
}

} // namespace CharEscape
