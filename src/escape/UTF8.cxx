// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "UTF8.hxx"
#include "char-escape/Rule.hxx"

#include <utility>

static constexpr bool
IsContinuation(unsigned char ch) noexcept
{
	return (ch & 0xc0) == 0x80;
}

std::pair<char32_t, std::size_t>
DecodeUTF8(std::string_view s) noexcept
{
	if (s.empty())
		return {0, 0};

	const unsigned char lead = s.front();
	if (lead < 0x80)
		return {lead, 1};

	std::size_t length;
	char32_t ch, min;
	if ((lead & 0xe0) == 0xc0) {
		length = 2;
		ch = lead & 0x1f;
		min = 0x80;
	} else if ((lead & 0xf0) == 0xe0) {
		length = 3;
		ch = lead & 0x0f;
		min = 0x800;
	} else if ((lead & 0xf8) == 0xf0) {
		length = 4;
		ch = lead & 0x07;
		min = 0x10000;
	} else
		/* stray continuation byte or 0xf8..0xff */
		return {0, 0};

	if (s.size() < length)
		return {0, 0};

	for (std::size_t i = 1; i < length; ++i) {
		const unsigned char b = s[i];
		if (!IsContinuation(b))
			return {0, 0};

		ch = (ch << 6) | (b & 0x3f);
	}

	if (ch < min || ch > 0x10ffff || (ch >= 0xd800 && ch <= 0xdfff))
		return {0, 0};

	return {ch, length};
}

void
AppendUTF8(std::string &dest, char32_t ch)
{
	if (!CharEscape::IsUnicodeScalar(ch))
		/* U+FFFD REPLACEMENT CHARACTER */
		ch = 0xfffd;

	if (ch < 0x80) {
		dest.push_back(char(ch));
	} else if (ch < 0x800) {
		dest.push_back(char(0xc0 | (ch >> 6)));
		dest.push_back(char(0x80 | (ch & 0x3f)));
	} else if (ch < 0x10000) {
		dest.push_back(char(0xe0 | (ch >> 12)));
		dest.push_back(char(0x80 | ((ch >> 6) & 0x3f)));
		dest.push_back(char(0x80 | (ch & 0x3f)));
	} else {
		dest.push_back(char(0xf0 | (ch >> 18)));
		dest.push_back(char(0x80 | ((ch >> 12) & 0x3f)));
		dest.push_back(char(0x80 | ((ch >> 6) & 0x3f)));
		dest.push_back(char(0x80 | (ch & 0x3f)));
	}
}

std::string
UTF32ToUTF8(std::u32string_view src)
{
	std::string dest;
	dest.reserve(src.size());

	for (const char32_t ch : src)
		AppendUTF8(dest, ch);

	return dest;
}
