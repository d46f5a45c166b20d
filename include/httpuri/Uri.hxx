// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Scheme.hxx"
#include "Resource.hxx"

#include <optional>
#include <string_view>

/**
 * An absolute "http://" or "https://" URI as it appears in a HTTP/1.x
 * request line, dissected into its parts.  Like #HttpResource, this
 * only refers to the string passed to Parse() and does not own any
 * memory.
 */
struct HttpUri {
	HttpScheme scheme;

	/**
	 * Everything between "://" and the first slash, e.g.
	 * "example.com:8080".  Never empty.  Its syntax is not
	 * checked.
	 */
	std::string_view authority;

	HttpResource resource;

	/**
	 * Dissect an absolute URI.  The string must not contain
	 * whitespace; this is not checked.
	 *
	 * @return std::nullopt if there is no "://", if the scheme is
	 * neither "http" nor "https" or if the authority is empty
	 */
	[[gnu::pure]]
	static std::optional<HttpUri> Parse(std::string_view s) noexcept;

	constexpr uint16_t GetDefaultPort() const noexcept {
		return ::GetDefaultPort(scheme);
	}

	bool operator==(const HttpUri &) const noexcept = default;
};
