// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "httpuri/Scheme.hxx"

using std::string_view_literals::operator""sv;

std::optional<HttpScheme>
ParseHttpScheme(std::string_view token) noexcept
{
	if (token == "http"sv)
		return HttpScheme::HTTP;
	else if (token == "https"sv)
		return HttpScheme::HTTPS;
	else
		return std::nullopt;
}
