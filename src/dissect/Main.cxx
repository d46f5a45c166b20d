// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "CommandLine.hxx"
#include "Input.hxx"
#include "Logger.hxx"

#include <system_error>

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>

int
main(int argc, char **argv)
try {
	DissectCmdLine cmdline;
	ParseCommandLine(cmdline, argc, argv);

	DissectStats stats;

	if (!cmdline.inputs.empty()) {
		for (const char *input : cmdline.inputs)
			DissectOne(stats, stdout, input, cmdline.options);
	} else {
		const auto file = OpenInput(cmdline.file != nullptr
					    ? cmdline.file
					    : "-");
		DissectFile(stats, stdout, file.get(), cmdline.options);
	}

	if (fflush(stdout) != 0)
		throw std::system_error(errno, std::system_category(),
					"Failed to write output");

	LogFmt(3, "dissect", "{} inputs, {} rejected",
	       stats.processed, stats.rejected);

	return stats.GetExitStatus();
} catch (...) {
	LogConcat(0, "dissect", std::current_exception());
	return EXIT_FAILURE;
}
