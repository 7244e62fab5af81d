// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

/*
 * Parse command line options.
 */

#pragma once

#include <vector>

enum class Command {
	ESCAPE,
	UNESCAPE,
	CHECK,
};

struct CmdLine {
	/**
	 * Load the rules from this file instead of using a built-in
	 * table.
	 */
	const char *rule_file = nullptr;

	/**
	 * The name of the built-in table.
	 */
	const char *table = "c";

	Command command = Command::ESCAPE;

	/**
	 * The strings to be processed; if empty, stdin is read.
	 */
	std::vector<const char *> texts;
};

void
ParseCommandLine(CmdLine &cmdline, int argc, char **argv);
