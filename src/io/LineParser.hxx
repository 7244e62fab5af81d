// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <stdexcept>
#include <string>

/**
 * Splits one line of a configuration file into words and values.
 * The line buffer is modified in place: tokens are null-terminated
 * and quoted values are unescaped.
 */
class LineParser {
	char *p;

public:
	using Error = std::runtime_error;

	explicit LineParser(char *_p) noexcept;

	LineParser(const LineParser &) = delete;
	LineParser &operator=(const LineParser &) = delete;

	void Strip() noexcept;

	char front() const noexcept {
		return *p;
	}

	bool IsEnd() const noexcept {
		return front() == 0;
	}

	void ExpectEnd() {
		if (!IsEnd())
			throw Error(std::string("Unexpected tokens at end of line: ") + p);
	}

	/**
	 * If the next word matches the given parameter, then skip it and
	 * return true.  If not, the method returns false, leaving the
	 * object unmodified.
	 */
	bool SkipWord(const char *word) noexcept;

	const char *NextWord() noexcept;
	char *NextValue() noexcept;

	/**
	 * Parse a quoted value, resolving the backslash escapes \n, \r,
	 * \t, \\, \' and \".  Returns nullptr if there is no quoted
	 * value or if it contains an unknown escape.
	 */
	char *NextUnescape() noexcept;

	bool NextBool();

	const char *ExpectWord();

	/**
	 * Like NextUnescape(), but throw if there is no valid quoted
	 * value.
	 */
	char *ExpectUnescape();

	static constexpr bool IsWhitespace(char ch) noexcept {
		return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
	}

	static constexpr bool IsWordChar(char ch) noexcept {
		return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
			(ch >= '0' && ch <= '9') || ch == '_';
	}

private:
	char *NextUnquotedValue() noexcept;
	char *NextQuotedValue(char stop) noexcept;

	static constexpr bool IsUnquotedChar(char ch) noexcept {
		return IsWordChar(ch) || ch == '.' || ch == '-' || ch == ':';
	}

	static constexpr bool IsQuote(char ch) noexcept {
		return ch == '"' || ch == '\'';
	}
};
