// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * Level-filtered logging to stderr.  Level 0 is fatal, 1 is errors
 * (the default), higher levels are informational and debug messages.
 */

#pragma once

#include <fmt/core.h>
#include <fmt/format.h>

#include <exception>
#include <iterator>
#include <string>
#include <string_view>

void
SetLogLevel(unsigned level) noexcept;

[[gnu::pure]]
bool
CheckLogLevel(unsigned level) noexcept;

void
LogString(unsigned level, std::string_view domain,
	  std::string_view msg) noexcept;

void
LogVFmt(unsigned level, std::string_view domain,
	fmt::string_view format_str, fmt::format_args args) noexcept;

template<typename... Args>
void
LogFmt(unsigned level, std::string_view domain,
       fmt::format_string<Args...> format_str, Args&&... args) noexcept
{
	if (!CheckLogLevel(level))
		return;

	LogVFmt(level, domain, format_str, fmt::make_format_args(args...));
}

/**
 * Concatenate all arguments (anything libfmt can format) into one
 * message.
 */
template<typename... Args>
void
LogConcat(unsigned level, std::string_view domain,
	  const Args&... args) noexcept
{
	if (!CheckLogLevel(level))
		return;

	fmt::memory_buffer buffer;
	(fmt::format_to(std::back_inserter(buffer), "{}", args), ...);
	LogString(level, domain, {buffer.data(), buffer.size()});
}

/**
 * Log the message of the given exception, including all nested
 * exceptions.
 */
void
LogConcat(unsigned level, std::string_view domain,
	  std::exception_ptr ep) noexcept;

/**
 * Obtain the full message of the given exception and all exceptions
 * nested in it, separated by ": ".
 */
std::string
GetFullMessage(std::exception_ptr ep) noexcept;
