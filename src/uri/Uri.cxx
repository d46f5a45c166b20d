// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "httpuri/Uri.hxx"

using std::string_view_literals::operator""sv;

std::optional<HttpUri>
HttpUri::Parse(std::string_view s) noexcept
{
	static constexpr auto delimiter = "://"sv;

	const auto d = s.find(delimiter);
	if (d == s.npos)
		return std::nullopt;

	const auto scheme = ParseHttpScheme(s.substr(0, d));
	if (!scheme)
		return std::nullopt;

	auto authority = s.substr(d + delimiter.size());
	std::string_view rest{};

	if (const auto slash = authority.find('/'); slash != authority.npos) {
		/* the resource keeps its leading slash */
		rest = authority.substr(slash);
		authority = authority.substr(0, slash);
	}

	if (authority.empty())
		return std::nullopt;

	return HttpUri{
		.scheme = *scheme,
		.authority = authority,
		.resource = HttpResource::Parse(rest),
	};
}
