// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

/**
 * The two URI schemes which RFC 7230 2.7 defines for HTTP request
 * targets.
 */
enum class HttpScheme : uint8_t {
	HTTP,
	HTTPS,
};

/**
 * Parse a scheme token (without the "://").  Only the exact
 * lower-case spellings "http" and "https" are accepted.
 *
 * @return the scheme or std::nullopt if the token is not recognized
 */
[[gnu::pure]]
std::optional<HttpScheme>
ParseHttpScheme(std::string_view token) noexcept;

constexpr std::string_view
ToString(HttpScheme scheme) noexcept
{
	switch (scheme) {
	case HttpScheme::HTTP:
		return "http";

	case HttpScheme::HTTPS:
		return "https";
	}

	return {};
}

constexpr uint16_t
GetDefaultPort(HttpScheme scheme) noexcept
{
	return scheme == HttpScheme::HTTPS ? 443 : 80;
}
