// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <string>
#include <string_view>

#include <stdio.h>

enum class Command;
namespace CharEscape { class Escaper; }

/**
 * Read the whole file, minus one trailing newline.
 *
 * Throws std::system_error on error.
 */
std::string
ReadText(FILE *file);

/**
 * Apply the command to one text and print the result (if any) to
 * the given file.  Errors in the text are logged.
 *
 * @return true on success, false if the text could not be
 * unescaped, is not valid UTF-8 or (for Command::CHECK) is not
 * properly escaped
 */
bool
Run(const CharEscape::Escaper &escaper, Command command,
    std::string_view text, FILE *out);
