// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

/*
 * Rule tables known at compile time.
 */

#pragma once

#include "Rule.hxx"
#include "Escaper.hxx"

#include <array>
#include <cstddef>

namespace CharEscape {

static constexpr char32_t DEFAULT_ESCAPE_CHAR = U'\\';

/**
 * Build a rule table from the given rules plus the rule which
 * escapes the escape character with itself.  That implicit rule
 * is appended after the others, so an explicit rule for the escape
 * character takes precedence.
 */
template<std::size_t N>
constexpr std::array<EscapeRule, N + 1>
MakeRuleTable(char32_t escape_char, const EscapeRule (&rules)[N]) noexcept
{
	std::array<EscapeRule, N + 1> result{};
	for (std::size_t i = 0; i < N; ++i)
		result[i] = rules[i];
	result[N] = {escape_char, escape_char};
	return result;
}

template<std::size_t N>
constexpr std::array<EscapeRule, N + 1>
MakeRuleTable(const EscapeRule (&rules)[N]) noexcept
{
	return MakeRuleTable(DEFAULT_ESCAPE_CHAR, rules);
}

/**
 * Escapes like C string literals: newline, carriage return, tab,
 * backslash, single and double quote.
 */
inline constexpr EscapeRule c_style_rules[] = {
	{U'\n', U'n'},
	{U'\r', U'r'},
	{U'\t', U't'},
	{U'\\', U'\\'},
	{U'\'', U'\''},
	{U'"', U'"'},
};

static_assert(HasEscapeCharRule(DEFAULT_ESCAPE_CHAR, c_style_rules));
static_assert(HasOnlyUnicodeScalars(DEFAULT_ESCAPE_CHAR, c_style_rules));

inline constexpr Escaper c_style_escaper =
	Escaper::Unchecked(DEFAULT_ESCAPE_CHAR, c_style_rules);

/**
 * Escapes all ASCII whitespace, space becomes "\w".
 */
inline constexpr auto whitespace_rules = MakeRuleTable({
		EscapeRule{U'\n', U'n'},
		EscapeRule{U'\r', U'r'},
		EscapeRule{U'\t', U't'},
		EscapeRule{U' ', U'w'},
	});

static_assert(HasEscapeCharRule(DEFAULT_ESCAPE_CHAR, whitespace_rules));
static_assert(HasOnlyUnicodeScalars(DEFAULT_ESCAPE_CHAR, whitespace_rules));

inline constexpr Escaper whitespace_escaper =
	Escaper::Unchecked(DEFAULT_ESCAPE_CHAR, whitespace_rules);

} // namespace CharEscape
