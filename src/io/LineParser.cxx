// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "LineParser.hxx"

#include <string.h>

static char *
StripLeft(char *p) noexcept
{
	while (LineParser::IsWhitespace(*p))
		++p;
	return p;
}

static void
StripRight(char *p) noexcept
{
	size_t length = strlen(p);
	while (length > 0 && LineParser::IsWhitespace(p[length - 1]))
		--length;
	p[length] = 0;
}

LineParser::LineParser(char *_p) noexcept
	:p(StripLeft(_p))
{
	StripRight(p);
}

void
LineParser::Strip() noexcept
{
	p = StripLeft(p);
}

bool
LineParser::SkipWord(const char *word) noexcept
{
	char *q = p;

	do {
		if (*q++ != *word)
			return false;
	} while (*++word != 0);

	if (*q == 0) {
		p = q;
		return true;
	} else if (IsWhitespace(*q)) {
		p = StripLeft(q + 1);
		return true;
	} else
		return false;
}

const char *
LineParser::NextWord() noexcept
{
	if (!IsWordChar(front()))
		return nullptr;

	const char *result = p;
	do {
		++p;
	} while (IsWordChar(front()));

	if (IsWhitespace(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd())
		return nullptr;

	return result;
}

inline char *
LineParser::NextUnquotedValue() noexcept
{
	if (!IsUnquotedChar(front()))
		return nullptr;

	char *result = p;
	do {
		++p;
	} while (IsUnquotedChar(front()));

	if (IsWhitespace(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd())
		return nullptr;

	return result;
}

inline char *
LineParser::NextQuotedValue(const char stop) noexcept
{
	char *const value = p;
	char *q = strchr(p, stop);
	if (q == nullptr)
		return nullptr;

	*q++ = 0;
	p = StripLeft(q);
	return value;
}

char *
LineParser::NextValue() noexcept
{
	const char ch = front();
	if (IsQuote(ch)) {
		++p;
		return NextQuotedValue(ch);
	} else
		return NextUnquotedValue();
}

char *
LineParser::NextUnescape() noexcept
{
	const char stop = front();
	if (!IsQuote(stop))
		return nullptr;

	char *dest = ++p;
	char *const value = dest;

	while (true) {
		char ch = *p++;

		if (ch == 0)
			return nullptr;
		else if (ch == stop) {
			*dest = 0;
			Strip();
			return value;
		} else if (ch == '\\') {
			ch = *p++;

			switch (ch) {
			case 'r':
				*dest++ = '\r';
				break;

			case 'n':
				*dest++ = '\n';
				break;

			case 't':
				*dest++ = '\t';
				break;

			case '\\':
			case '\'':
			case '\"':
				*dest++ = ch;
				break;

			default:
				return nullptr;
			}
		} else
			*dest++ = ch;
	}
}

bool
LineParser::NextBool()
{
	const char *value = NextValue();
	if (value == nullptr)
		throw Error("yes/no expected");

	if (strcmp(value, "yes") == 0)
		return true;
	else if (strcmp(value, "no") == 0)
		return false;
	else
		throw Error("yes/no expected");
}

const char *
LineParser::ExpectWord()
{
	const char *word = NextWord();
	if (word == nullptr)
		throw Error("Word expected");

	return word;
}

char *
LineParser::ExpectUnescape()
{
	char *value = NextUnescape();
	if (value == nullptr)
		throw Error("Quoted value expected");

	return value;
}
