// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * libfmt formatters which reassemble dissected URIs.
 */

#pragma once

#include "Scheme.hxx"
#include "Resource.hxx"
#include "Uri.hxx"

#include <fmt/format.h>

template<>
struct fmt::formatter<HttpScheme> : formatter<string_view>
{
	template<typename FormatContext>
	auto format(HttpScheme scheme, FormatContext &ctx) const {
		return formatter<string_view>::format(ToString(scheme), ctx);
	}
};

/**
 * Writes "path?query#fragment"; the query and the fragment are
 * omitted if absent.
 */
template<>
struct fmt::formatter<HttpResource>
{
	constexpr auto parse(format_parse_context &ctx) {
		return ctx.begin();
	}

	template<typename FormatContext>
	auto format(const HttpResource &resource, FormatContext &ctx) const {
		auto out = fmt::format_to(ctx.out(), "{}", resource.path);

		if (resource.query)
			out = fmt::format_to(out, "?{}", *resource.query);

		if (resource.fragment)
			out = fmt::format_to(out, "#{}", *resource.fragment);

		return out;
	}
};

template<>
struct fmt::formatter<HttpUri>
{
	constexpr auto parse(format_parse_context &ctx) {
		return ctx.begin();
	}

	template<typename FormatContext>
	auto format(const HttpUri &uri, FormatContext &ctx) const {
		return fmt::format_to(ctx.out(), "{}://{}{}",
				      ToString(uri.scheme), uri.authority,
				      uri.resource);
	}
};
