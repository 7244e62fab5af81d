// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "CommandLine.hxx"
#include "Tables.hxx"
#include "Logger.hxx"

#include <getopt.h>
#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

static void
PrintUsage()
{
	puts("usage: char-escape [options] escape|unescape|check [TEXT...]\n\n"
	     "valid options:\n"
	     " --help\n"
	     " -h             help (this text)\n"
	     " --version\n"
	     " -V             show char-escape version\n"
	     " --verbose\n"
	     " -v             be more verbose\n"
	     " --quiet\n"
	     " -q             be quiet\n"
	     " --rules file\n"
	     " -f file        load the escape rules from this file\n"
	     " --table NAME\n"
	     " -t NAME        use a built-in rule table (c, whitespace)\n"
	     "\n"
	     "Without TEXT arguments, the text is read from stdin.\n"
	     );
}

[[noreturn]] [[gnu::format(printf, 2, 3)]]
static void
arg_error(const char *argv0, const char *fmt, ...)
{
	if (fmt != nullptr) {
		va_list ap;

		fputs(argv0, stderr);
		fputs(": ", stderr);

		va_start(ap, fmt);
		vfprintf(stderr, fmt, ap);
		va_end(ap);

		putc('\n', stderr);
	}

	fprintf(stderr, "Try '%s --help' for more information.\n",
		argv0);
	exit(EXIT_FAILURE);
}

static Command
ParseCommand(const char *argv0, const char *s)
{
	if (strcmp(s, "escape") == 0)
		return Command::ESCAPE;
	else if (strcmp(s, "unescape") == 0)
		return Command::UNESCAPE;
	else if (strcmp(s, "check") == 0)
		return Command::CHECK;
	else
		arg_error(argv0, "unknown command: %s", s);
}

void
ParseCommandLine(CmdLine &cmdline, int argc, char **argv)
{
	static constexpr struct option long_options[] = {
		{"help", 0, nullptr, 'h'},
		{"version", 0, nullptr, 'V'},
		{"verbose", 0, nullptr, 'v'},
		{"quiet", 0, nullptr, 'q'},
		{"rules", 1, nullptr, 'f'},
		{"table", 1, nullptr, 't'},
		{nullptr, 0, nullptr, 0}
	};
	unsigned verbose = 1;

	while (true) {
		int option_index = 0;

		int ret = getopt_long(argc, argv, "hVvqf:t:",
				      long_options, &option_index);
		if (ret == -1)
			break;

		switch (ret) {
		case 'h':
			PrintUsage();
			exit(EXIT_SUCCESS);

		case 'V':
			printf("char-escape v%s\n", VERSION);
			exit(EXIT_SUCCESS);

		case 'v':
			++verbose;
			break;

		case 'q':
			verbose = 0;
			break;

		case 'f':
			cmdline.rule_file = optarg;
			break;

		case 't':
			if (FindBuiltinTable(optarg) == nullptr)
				arg_error(argv[0], "unknown table: %s", optarg);

			cmdline.table = optarg;
			break;

		case '?':
			arg_error(argv[0], nullptr);

		default:
			exit(EXIT_FAILURE);
		}
	}

	SetLogLevel(verbose);

	/* check non-option arguments */

	if (optind >= argc)
		arg_error(argv[0], "command expected");

	cmdline.command = ParseCommand(argv[0], argv[optind++]);

	while (optind < argc)
		cmdline.texts.push_back(argv[optind++]);
}
