// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

/*
 * std::hash specializations, for use as keys in unordered
 * containers.  Equal objects (structural equality of the referenced
 * substrings) have equal hashes.
 */

#pragma once

#include "Scheme.hxx"
#include "Resource.hxx"
#include "Uri.hxx"

#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>

namespace HttpUriHash {

constexpr std::size_t
Combine(std::size_t seed, std::size_t value) noexcept
{
	return seed ^ (value + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}

inline std::size_t
Hash(std::string_view s) noexcept
{
	return std::hash<std::string_view>{}(s);
}

/**
 * An absent value hashes differently from an empty one.
 */
inline std::size_t
Hash(const std::optional<std::string_view> &s) noexcept
{
	return s ? Combine(1, Hash(*s)) : 0;
}

} // namespace HttpUriHash

template<>
struct std::hash<HttpResource> {
	std::size_t operator()(const HttpResource &r) const noexcept {
		std::size_t h = HttpUriHash::Hash(r.path);
		h = HttpUriHash::Combine(h, HttpUriHash::Hash(r.query));
		h = HttpUriHash::Combine(h, HttpUriHash::Hash(r.fragment));
		return h;
	}
};

template<>
struct std::hash<HttpUri> {
	std::size_t operator()(const HttpUri &uri) const noexcept {
		std::size_t h = std::hash<HttpScheme>{}(uri.scheme);
		h = HttpUriHash::Combine(h, HttpUriHash::Hash(uri.authority));
		h = HttpUriHash::Combine(h, std::hash<HttpResource>{}(uri.resource));
		return h;
	}
};
