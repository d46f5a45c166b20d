// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Dissect.hxx"

#include <vector>

struct DissectCmdLine {
	DissectOptions options;

	/**
	 * Read inputs line by line from this file; "-" means stdin.
	 * If this is nullptr and #inputs is empty, stdin is read.
	 */
	const char *file = nullptr;

	/**
	 * Inputs given as non-option arguments.
	 */
	std::vector<const char *> inputs;
};

/**
 * Parse the command line.  Prints a message and exits on error.
 */
void
ParseCommandLine(DissectCmdLine &cmdline, int argc, char **argv);
