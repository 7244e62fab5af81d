// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "char-escape/Escaper.hxx"
#include "char-escape/Error.hxx"
#include "UTF8.hxx"

namespace CharEscape {

/**
 * Find the first rule for the given raw character.
 */
[[gnu::pure]]
static const EscapeRule *
FindRaw(std::span<const EscapeRule> rules, char32_t ch) noexcept
{
	for (const auto &i : rules)
		if (i.raw == ch)
			return &i;
	return nullptr;
}

/**
 * Find the first rule for the given escaped character.
 */
[[gnu::pure]]
static const EscapeRule *
FindEscaped(std::span<const EscapeRule> rules, char32_t ch) noexcept
{
	for (const auto &i : rules)
		if (i.escaped == ch)
			return &i;
	return nullptr;
}

namespace {

class UTF32Reader {
	std::u32string_view src;

public:
	explicit constexpr UTF32Reader(std::u32string_view _src) noexcept
		:src(_src) {}

	constexpr std::size_t GetSizeHint() const noexcept {
		return src.size();
	}

	constexpr bool Next(char32_t &ch) noexcept {
		if (src.empty())
			return false;

		ch = src.front();
		src.remove_prefix(1);
		return true;
	}

	constexpr void CheckMalformed() const noexcept {}
};

/**
 * Decodes UTF-8 one code point at a time.  Next() returns false at
 * the end of the input or at the first malformed sequence; the
 * caller distinguishes the two with IsMalformed().
 */
class UTF8Reader {
	const std::string_view src;
	std::size_t position = 0;
	bool malformed = false;

public:
	explicit constexpr UTF8Reader(std::string_view _src) noexcept
		:src(_src) {}

	constexpr std::size_t GetSizeHint() const noexcept {
		return src.size();
	}

	bool Next(char32_t &ch) noexcept {
		if (position >= src.size())
			return false;

		const auto [value, length] = DecodeUTF8(src.substr(position));
		if (length == 0) {
			malformed = true;
			return false;
		}

		ch = value;
		position += length;
		return true;
	}

	constexpr bool IsMalformed() const noexcept {
		return malformed;
	}

	void CheckMalformed() const {
		if (malformed)
			throw MalformedUTF8Error(position);
	}
};

} // anonymous namespace

static void
Append(std::u32string &dest, char32_t ch)
{
	dest.push_back(ch);
}

static void
Append(std::string &dest, char32_t ch)
{
	AppendUTF8(dest, ch);
}

template<typename Reader, typename String>
static void
EscapeTo(char32_t escape_char, std::span<const EscapeRule> rules,
	 Reader &src, String &dest)
{
	dest.reserve(src.GetSizeHint() * 2);

	char32_t ch;
	while (src.Next(ch)) {
		if (const auto *rule = FindRaw(rules, ch)) {
			Append(dest, escape_char);
			Append(dest, rule->escaped);
		} else
			Append(dest, ch);
	}

	src.CheckMalformed();
}

template<typename Reader, typename String>
static void
UnescapeTo(char32_t escape_char, std::span<const EscapeRule> rules,
	   Reader &src, String &dest)
{
	dest.reserve(src.GetSizeHint());

	bool previous_was_escape_char = false;

	char32_t ch;
	while (src.Next(ch)) {
		if (previous_was_escape_char) {
			const auto *rule = FindEscaped(rules, ch);
			if (rule == nullptr)
				throw UnescapeError::Invalid(escape_char, ch);

			Append(dest, rule->raw);
			previous_was_escape_char = false;
		} else if (ch == escape_char)
			previous_was_escape_char = true;
		else
			Append(dest, ch);
	}

	src.CheckMalformed();

	if (previous_was_escape_char)
		throw UnescapeError::Incomplete();
}

template<typename Reader>
[[gnu::pure]]
static bool
IsEscaped(char32_t escape_char, std::span<const EscapeRule> rules,
	  Reader &src) noexcept
{
	bool previous_was_escape_char = false;

	char32_t ch;
	while (src.Next(ch)) {
		if (previous_was_escape_char) {
			if (FindEscaped(rules, ch) == nullptr)
				/* invalid escape sequence */
				return false;

			previous_was_escape_char = false;
		} else if (ch == escape_char)
			previous_was_escape_char = true;
		else if (FindRaw(rules, ch) != nullptr)
			/* this character should have been escaped */
			return false;
	}

	return !previous_was_escape_char;
}

Escaper::Escaper(char32_t _escape_char, std::span<const EscapeRule> _rules)
	:escape_char(_escape_char), rules(_rules)
{
	if (!IsUnicodeScalar(escape_char))
		throw InvalidCharacterError(escape_char);

	for (const auto &rule : rules) {
		if (!IsUnicodeScalar(rule.raw))
			throw InvalidCharacterError(rule.raw);
		if (!IsUnicodeScalar(rule.escaped))
			throw InvalidCharacterError(rule.escaped);
	}

	if (!HasEscapeCharRule(escape_char, rules))
		throw MissingEscapeCharRuleError();
}

std::u32string
Escaper::Escape(std::u32string_view s) const
{
	UTF32Reader src(s);
	std::u32string result;
	EscapeTo(escape_char, rules, src, result);
	return result;
}

std::string
Escaper::Escape(std::string_view s) const
{
	UTF8Reader src(s);
	std::string result;
	EscapeTo(escape_char, rules, src, result);
	return result;
}

std::u32string
Escaper::Unescape(std::u32string_view s) const
{
	UTF32Reader src(s);
	std::u32string result;
	UnescapeTo(escape_char, rules, src, result);
	return result;
}

std::string
Escaper::Unescape(std::string_view s) const
{
	UTF8Reader src(s);
	std::string result;
	UnescapeTo(escape_char, rules, src, result);
	return result;
}

bool
Escaper::IsEscaped(std::u32string_view s) const noexcept
{
	UTF32Reader src(s);
	return CharEscape::IsEscaped(escape_char, rules, src);
}

bool
Escaper::IsEscaped(std::string_view s) const noexcept
{
	UTF8Reader src(s);
	return CharEscape::IsEscaped(escape_char, rules, src) &&
		!src.IsMalformed();
}

} // namespace CharEscape
