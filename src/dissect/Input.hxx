// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Dissect.hxx"

#include <memory>
#include <string_view>

#include <stdio.h>

struct FileCloser {
	void operator()(FILE *file) const noexcept {
		if (file != stdin)
			fclose(file);
	}
};

using UniqueFile = std::unique_ptr<FILE, FileCloser>;

/**
 * Open a file for reading; "-" means stdin.
 *
 * Throws std::system_error on error.
 */
UniqueFile
OpenInput(const char *path);

/**
 * Reads lines with getline(3), without the line terminator.
 */
class LineReader {
	FILE *const file;

	char *line = nullptr;
	size_t capacity = 0;

public:
	explicit LineReader(FILE *_file) noexcept
		:file(_file) {}

	~LineReader() noexcept;

	LineReader(const LineReader &) = delete;
	LineReader &operator=(const LineReader &) = delete;

	/**
	 * Throws std::system_error on I/O error.
	 *
	 * @return false at the end of the file
	 */
	bool Next(std::string_view &result);
};

struct DissectStats {
	unsigned processed = 0, rejected = 0;

	/**
	 * 2 if at least one input was rejected, 0 otherwise.
	 */
	int GetExitStatus() const noexcept {
		return rejected > 0 ? 2 : 0;
	}
};

/**
 * Dissect one input and write the result to #out.  Results after the
 * first one are separated by an empty line unless the canonical form
 * is printed.
 */
void
DissectOne(DissectStats &stats, FILE *out, std::string_view input,
	   const DissectOptions &options);

/**
 * Dissect each non-empty line of #in.  A rejected line does not stop
 * processing.
 *
 * Throws std::system_error on I/O error.
 */
void
DissectFile(DissectStats &stats, FILE *out, FILE *in,
	    const DissectOptions &options);
