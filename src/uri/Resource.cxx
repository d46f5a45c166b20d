// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "httpuri/Resource.hxx"

using std::string_view_literals::operator""sv;

static constexpr std::optional<std::string_view>
NonEmpty(std::string_view s) noexcept
{
	if (s.empty())
		return std::nullopt;

	return s;
}

HttpResource
HttpResource::Parse(std::string_view s) noexcept
{
	const auto qmark = s.find('?');
	const auto hash = s.find('#');

	std::string_view path = s, query{}, fragment{};

	if (hash != s.npos) {
		path = s.substr(0, hash);
		fragment = s.substr(hash + 1);
	}

	/* a question mark inside the fragment is not a query
	   delimiter */
	if (qmark < hash) {
		query = path.substr(qmark + 1);
		path = path.substr(0, qmark);
	}

	return {
		.path = path.empty() ? "/"sv : path,
		.query = NonEmpty(query),
		.fragment = NonEmpty(fragment),
	};
}
