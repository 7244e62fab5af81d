// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "char-escape/Error.hxx"
#include "UTF8.hxx"

#include <fmt/format.h>

#include <cstdint>

namespace CharEscape {

InvalidCharacterError::InvalidCharacterError(char32_t _ch)
	:std::runtime_error(fmt::format("not a Unicode scalar value: U+{:04X}",
					uint_least32_t(_ch))),
	 ch(_ch) {}

UnescapeError
UnescapeError::Invalid(char32_t escape_char, char32_t ch)
{
	std::u32string sequence{escape_char, ch};
	const auto msg = fmt::format("invalid escape sequence: {}",
				     UTF32ToUTF8(sequence));
	return {UnescapeErrorCode::INVALID, std::move(sequence), msg};
}

UnescapeError
UnescapeError::Incomplete()
{
	return {UnescapeErrorCode::INCOMPLETE, {},
		"incomplete escape sequence"};
}

std::string
UnescapeError::GetSequenceUTF8() const
{
	return UTF32ToUTF8(sequence);
}

MalformedUTF8Error::MalformedUTF8Error(std::size_t _offset)
	:std::runtime_error(fmt::format("malformed UTF-8 at offset {}",
					_offset)),
	 offset(_offset) {}

} // namespace CharEscape
