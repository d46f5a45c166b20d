// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Logger.hxx"

#include <iterator>
#include <new>

#include <stdio.h>

static unsigned log_level = 1;

void
SetLogLevel(unsigned level) noexcept
{
	log_level = level;
}

bool
CheckLogLevel(unsigned level) noexcept
{
	return level <= log_level;
}

void
LogString(unsigned level, std::string_view domain,
	  std::string_view msg) noexcept
{
	if (!CheckLogLevel(level))
		return;

	/* write errors are ignored; there is nowhere left to report
	   them */
	try {
		fmt::memory_buffer buffer;
		fmt::format_to(std::back_inserter(buffer), "{}: {}\n",
			       domain, msg);
		fwrite(buffer.data(), 1, buffer.size(), stderr);
	} catch (const std::bad_alloc &) {
		fwrite(domain.data(), 1, domain.size(), stderr);
		fputs(": Out of memory\n", stderr);
	}
}

void
LogVFmt(unsigned level, std::string_view domain,
	fmt::string_view format_str, fmt::format_args args) noexcept
try {
	if (!CheckLogLevel(level))
		return;

	const auto msg = fmt::vformat(format_str, args);
	LogString(level, domain, msg);
} catch (const std::bad_alloc &) {
	LogString(level, domain, "Out of memory");
}

static void
AppendFullMessage(std::string &result, std::exception_ptr ep) noexcept
try {
	std::rethrow_exception(ep);
} catch (const std::exception &e) {
	if (!result.empty())
		result += ": ";
	result += e.what();

	try {
		std::rethrow_if_nested(e);
	} catch (...) {
		AppendFullMessage(result, std::current_exception());
	}
} catch (const char *s) {
	if (!result.empty())
		result += ": ";
	result += s;
} catch (...) {
	if (!result.empty())
		result += ": ";
	result += "Unknown exception";
}

std::string
GetFullMessage(std::exception_ptr ep) noexcept
{
	std::string result;
	AppendFullMessage(result, ep);
	return result;
}

void
LogConcat(unsigned level, std::string_view domain,
	  std::exception_ptr ep) noexcept
{
	if (CheckLogLevel(level))
		LogString(level, domain, GetFullMessage(ep));
}
