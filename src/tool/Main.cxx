// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "CommandLine.hxx"
#include "Run.hxx"
#include "Tables.hxx"
#include "Logger.hxx"
#include "escape/RuleFile.hxx"
#include "escape/RuleSet.hxx"
#include "char-escape/Escaper.hxx"

#include <optional>

#include <stdio.h>
#include <stdlib.h>

static const Logger logger("char-escape");

int
main(int argc, char **argv) noexcept
try {
	CmdLine cmdline;
	ParseCommandLine(cmdline, argc, argv);

	std::optional<RuleSet> rule_set;
	std::optional<CharEscape::Escaper> custom_escaper;
	const CharEscape::Escaper *escaper;

	if (cmdline.rule_file != nullptr) {
		rule_set = LoadRuleFile(cmdline.rule_file);
		logger.Fmt(2, "loaded {} rules from {}",
			   rule_set->GetRules().size(), cmdline.rule_file);

		custom_escaper = rule_set->MakeEscaper();
		escaper = &*custom_escaper;
	} else {
		escaper = FindBuiltinTable(cmdline.table);
		logger.Fmt(2, "using built-in table '{}'", cmdline.table);
	}

	bool success = true;

	if (cmdline.texts.empty()) {
		success = Run(*escaper, cmdline.command, ReadText(stdin),
			      stdout);
	} else {
		for (const char *text : cmdline.texts)
			if (!Run(*escaper, cmdline.command, text, stdout))
				success = false;
	}

	return success ? EXIT_SUCCESS : EXIT_FAILURE;
} catch (...) {
	logger(0, {}, std::current_exception());
	return EXIT_FAILURE;
}
