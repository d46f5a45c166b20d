// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <optional>
#include <string_view>

/**
 * The path, query and fragment of a request target.  All members
 * point into the string passed to Parse(); the caller must keep that
 * buffer alive for as long as this object is used.
 *
 * No percent-decoding is done.
 */
struct HttpResource {
	/**
	 * The path, never empty; at least "/".
	 */
	std::string_view path;

	/**
	 * The query string without the question mark.  Never present
	 * but empty.
	 */
	std::optional<std::string_view> query;

	/**
	 * The fragment without the hash sign.  Never present but
	 * empty.
	 */
	std::optional<std::string_view> fragment;

	/**
	 * Split a "path?query#fragment" string.  A question mark after
	 * the first hash sign is part of the fragment.  This never
	 * fails.
	 */
	[[gnu::pure]]
	static HttpResource Parse(std::string_view s) noexcept;

	bool HasQuery() const noexcept {
		return query.has_value();
	}

	bool HasFragment() const noexcept {
		return fragment.has_value();
	}

	bool operator==(const HttpResource &) const noexcept = default;
};
