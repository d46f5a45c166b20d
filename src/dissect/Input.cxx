// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Input.hxx"
#include "Logger.hxx"

#include <fmt/format.h>

#include <system_error>

#include <errno.h>
#include <stdlib.h>
#include <string.h>

UniqueFile
OpenInput(const char *path)
{
	if (strcmp(path, "-") == 0)
		return UniqueFile{stdin};

	FILE *file = fopen(path, "r");
	if (file == nullptr)
		throw std::system_error(errno, std::system_category(),
					fmt::format("Failed to open '{}'", path));

	return UniqueFile{file};
}

LineReader::~LineReader() noexcept
{
	free(line);
}

bool
LineReader::Next(std::string_view &result)
{
	ssize_t nbytes = getline(&line, &capacity, file);
	if (nbytes < 0) {
		if (ferror(file))
			throw std::system_error(errno, std::system_category(),
						"Failed to read input");
		return false;
	}

	std::string_view s{line, size_t(nbytes)};
	while (!s.empty() && (s.back() == '\n' || s.back() == '\r'))
		s.remove_suffix(1);

	result = s;
	return true;
}

void
DissectOne(DissectStats &stats, FILE *out, std::string_view input,
	   const DissectOptions &options)
{
	fmt::memory_buffer buffer;

	if (stats.processed > 0 && !options.canonical)
		buffer.push_back('\n');

	++stats.processed;
	if (!Dissect(buffer, input, options))
		++stats.rejected;

	fwrite(buffer.data(), 1, buffer.size(), out);
}

void
DissectFile(DissectStats &stats, FILE *out, FILE *in,
	    const DissectOptions &options)
{
	LineReader reader{in};
	std::string_view line;

	while (reader.Next(line)) {
		if (line.empty())
			continue;

		LogFmt(4, "dissect", "line {}: '{}'", stats.processed + 1, line);
		DissectOne(stats, out, line, options);
	}
}
