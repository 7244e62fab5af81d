// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

/*
 * Conversion between UTF-8 and UTF-32.
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

/**
 * Decode the code point at the beginning of the string.
 *
 * @return the code point and the number of bytes it occupies, or a
 * length of 0 if the sequence is malformed (truncated, overlong,
 * surrogate or beyond U+10FFFF)
 */
[[gnu::pure]]
std::pair<char32_t, std::size_t>
DecodeUTF8(std::string_view s) noexcept;

/**
 * Append the UTF-8 encoding of the given code point.  Surrogates and
 * values beyond U+10FFFF are written as U+FFFD.
 */
void
AppendUTF8(std::string &dest, char32_t ch);

std::string
UTF32ToUTF8(std::u32string_view src);
