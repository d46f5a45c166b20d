// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "CommandLine.hxx"
#include "Logger.hxx"

#include <fmt/core.h>

#include <utility>

#include <stdio.h>
#include <stdlib.h>
#include <getopt.h>

static void
PrintUsage()
{
	puts("usage: httpuri-dissect [options] [URI...]\n\n"
	     "valid options:\n"
#ifdef __GLIBC__
	     " --help\n"
#endif
	     " -h             help (this text)\n"
#ifdef __GLIBC__
	     " --version\n"
#endif
	     " -V             show httpuri-dissect version\n"
#ifdef __GLIBC__
	     " --verbose\n"
#endif
	     " -v             be more verbose\n"
#ifdef __GLIBC__
	     " --quiet\n"
#endif
	     " -q             be quiet\n"
#ifdef __GLIBC__
	     " --resource\n"
#endif
	     " -r             inputs are \"path?query#fragment\" strings\n"
#ifdef __GLIBC__
	     " --canonical\n"
#endif
	     " -c             print only the reassembled URI\n"
#ifdef __GLIBC__
	     " --file FILE\n"
#endif
	     " -f FILE        read one input per line from FILE (\"-\" = stdin)\n"
	     "\n"
	     "Without URI arguments and without --file, inputs are read from stdin.\n"
	     );
}

/**
 * Print a hint to "--help" and exit with status 1.
 */
[[noreturn]]
static void
UsageError(const char *argv0)
{
	fmt::print(stderr, "Try '{} --help' for more information.\n", argv0);
	exit(1);
}

template<typename... Args>
[[noreturn]]
static void
UsageError(const char *argv0,
	   fmt::format_string<Args...> format_str, Args&&... args)
{
	fmt::print(stderr, "{}: ", argv0);
	fmt::print(stderr, format_str, std::forward<Args>(args)...);
	fputc('\n', stderr);
	UsageError(argv0);
}

void
ParseCommandLine(DissectCmdLine &cmdline, int argc, char **argv)
{
	int ret;
#ifdef __GLIBC__
	static constexpr struct option long_options[] = {
		{"help", 0, nullptr, 'h'},
		{"version", 0, nullptr, 'V'},
		{"verbose", 0, nullptr, 'v'},
		{"quiet", 0, nullptr, 'q'},
		{"resource", 0, nullptr, 'r'},
		{"canonical", 0, nullptr, 'c'},
		{"file", 1, nullptr, 'f'},
		{nullptr, 0, nullptr, 0}
	};
#endif
	unsigned verbose = 1;

	while (1) {
#ifdef __GLIBC__
		int option_index = 0;

		ret = getopt_long(argc, argv, "hVvqrcf:",
				  long_options, &option_index);
#else
		ret = getopt(argc, argv, "hVvqrcf:");
#endif
		if (ret == -1)
			break;

		switch (ret) {
		case 'h':
			PrintUsage();
			exit(0);

		case 'V':
			printf("httpuri-dissect v%s\n", HTTPURI_VERSION);
			exit(0);

		case 'v':
			++verbose;
			break;

		case 'q':
			verbose = 0;
			break;

		case 'r':
			cmdline.options.mode = DissectMode::RESOURCE;
			break;

		case 'c':
			cmdline.options.canonical = true;
			break;

		case 'f':
			if (*optarg == 0)
				UsageError(argv[0], "Empty file name");

			cmdline.file = optarg;
			break;

		case '?':
			UsageError(argv[0]);

		default:
			exit(1);
		}
	}

	SetLogLevel(verbose);

	/* non-option arguments are inputs */

	for (int i = optind; i < argc; ++i)
		cmdline.inputs.push_back(argv[i]);

	if (cmdline.file != nullptr && !cmdline.inputs.empty())
		UsageError(argv[0], "cannot combine --file with {} URI argument(s)",
			   cmdline.inputs.size());
}
