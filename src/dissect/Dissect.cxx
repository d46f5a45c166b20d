// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Dissect.hxx"
#include "Logger.hxx"
#include "httpuri/Uri.hxx"
#include "httpuri/Format.hxx"

#include <iterator>

static void
FormatResource(fmt::memory_buffer &out, const HttpResource &resource)
{
	auto o = std::back_inserter(out);

	fmt::format_to(o, "path: {}\n", resource.path);

	if (resource.query)
		fmt::format_to(o, "query: {}\n", *resource.query);

	if (resource.fragment)
		fmt::format_to(o, "fragment: {}\n", *resource.fragment);
}

static void
FormatUri(fmt::memory_buffer &out, const HttpUri &uri)
{
	fmt::format_to(std::back_inserter(out),
		       "scheme: {}\n"
		       "authority: {}\n",
		       uri.scheme, uri.authority);

	FormatResource(out, uri.resource);
}

bool
Dissect(fmt::memory_buffer &out, std::string_view input,
	const DissectOptions &options)
{
	if (options.mode == DissectMode::RESOURCE) {
		const auto resource = HttpResource::Parse(input);
		if (options.canonical)
			fmt::format_to(std::back_inserter(out), "{}\n", resource);
		else
			FormatResource(out, resource);
		return true;
	}

	const auto uri = HttpUri::Parse(input);
	if (!uri) {
		LogFmt(2, "dissect", "malformed URI: '{}'", input);
		fmt::format_to(std::back_inserter(out),
			       "error: malformed URI\n");
		return false;
	}

	if (options.canonical)
		fmt::format_to(std::back_inserter(out), "{}\n", *uri);
	else
		FormatUri(out, *uri);
	return true;
}
