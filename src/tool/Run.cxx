// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Run.hxx"
#include "CommandLine.hxx"
#include "Logger.hxx"
#include "char-escape/Error.hxx"
#include "char-escape/Escaper.hxx"

#include <fmt/core.h>

#include <system_error>

#include <errno.h>

static const Logger logger("char-escape");

std::string
ReadText(FILE *file)
{
	std::string result;

	char buffer[4096];
	size_t nbytes;
	while ((nbytes = fread(buffer, 1, sizeof(buffer), file)) > 0)
		result.append(buffer, nbytes);

	if (ferror(file))
		throw std::system_error(errno, std::system_category(),
					"Failed to read input");

	if (!result.empty() && result.back() == '\n')
		result.pop_back();

	return result;
}

bool
Run(const CharEscape::Escaper &escaper, Command command,
    std::string_view text, FILE *out)
try {
	switch (command) {
	case Command::ESCAPE:
		fmt::print(out, "{}\n", escaper.Escape(text));
		return true;

	case Command::UNESCAPE:
		fmt::print(out, "{}\n", escaper.Unescape(text));
		return true;

	case Command::CHECK:
		if (escaper.IsEscaped(text)) {
			logger(2, "escaped");
			return true;
		} else {
			logger(2, "not escaped");
			return false;
		}
	}

	return false;
} catch (const CharEscape::UnescapeError &e) {
	logger(1, e.what());
	return false;
} catch (const CharEscape::MalformedUTF8Error &e) {
	logger(1, e.what());
	return false;
}
