// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <string_view>

enum class DissectMode : uint8_t {
	/**
	 * Inputs are absolute "http://" or "https://" URIs.
	 */
	URI,

	/**
	 * Inputs are "path?query#fragment" strings.
	 */
	RESOURCE,
};

struct DissectOptions {
	DissectMode mode = DissectMode::URI;

	/**
	 * Print only the reassembled URI instead of one line per
	 * component.
	 */
	bool canonical = false;
};

/**
 * Dissect one input and append the human-readable result to the
 * buffer.
 *
 * @return false if the input was rejected (an error line has been
 * appended instead)
 */
bool
Dissect(fmt::memory_buffer &out, std::string_view input,
	const DissectOptions &options);
