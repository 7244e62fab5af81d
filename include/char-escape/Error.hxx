// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace CharEscape {

/**
 * Thrown by the validating #Escaper constructor if the rule table
 * has no rule for the escape character.
 */
class MissingEscapeCharRuleError : public std::runtime_error {
public:
	MissingEscapeCharRuleError()
		:std::runtime_error("no escape sequence defined for the escape character") {}

	/* the error carries no data, so all instances are equal */
	bool operator==(const MissingEscapeCharRuleError &) const noexcept {
		return true;
	}
};

/**
 * Thrown by the validating #Escaper constructor if the escape
 * character or a rule is not a Unicode scalar value (a surrogate or
 * beyond U+10FFFF).  Such a character cannot be encoded as UTF-8.
 */
class InvalidCharacterError : public std::runtime_error {
	char32_t ch;

public:
	explicit InvalidCharacterError(char32_t _ch);

	char32_t GetCharacter() const noexcept {
		return ch;
	}
};

/**
 * Error codes for #UnescapeError.
 */
enum class UnescapeErrorCode {
	/**
	 * The escape character was followed by a character which no
	 * rule escapes to.
	 */
	INVALID,

	/**
	 * The string ended with a lone escape character.
	 */
	INCOMPLETE,
};

class UnescapeError : public std::runtime_error {
	UnescapeErrorCode code;

	/**
	 * The offending two-character sequence (only for
	 * #UnescapeErrorCode::INVALID).
	 */
	std::u32string sequence;

	UnescapeError(UnescapeErrorCode _code, std::u32string &&_sequence,
		      const std::string &_msg)
		:std::runtime_error(_msg), code(_code),
		 sequence(std::move(_sequence)) {}

public:
	[[gnu::cold]]
	static UnescapeError Invalid(char32_t escape_char, char32_t ch);

	[[gnu::cold]]
	static UnescapeError Incomplete();

	UnescapeErrorCode GetCode() const noexcept {
		return code;
	}

	std::u32string_view GetSequence() const noexcept {
		return sequence;
	}

	/**
	 * Returns the offending sequence encoded as UTF-8.
	 */
	std::string GetSequenceUTF8() const;

	bool operator==(const UnescapeError &other) const noexcept {
		return code == other.code && sequence == other.sequence;
	}
};

/**
 * Thrown by the UTF-8 overloads of Escaper::Escape() and
 * Escaper::Unescape() if the input is not valid UTF-8.
 */
class MalformedUTF8Error : public std::runtime_error {
	std::size_t offset;

public:
	explicit MalformedUTF8Error(std::size_t _offset);

	/**
	 * The byte offset of the first malformed sequence.
	 */
	std::size_t GetOffset() const noexcept {
		return offset;
	}
};

} // namespace CharEscape
