// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "dissect/Dissect.hxx"
#include "Logger.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

static std::string
DissectToString(std::string_view input, DissectOptions options,
		bool expected_result=true)
{
	fmt::memory_buffer buffer;
	EXPECT_EQ(Dissect(buffer, input, options), expected_result) << input;
	return fmt::to_string(buffer);
}

TEST(Dissect, Uri)
{
	EXPECT_EQ(DissectToString("https://example.com:443/r/rarepuppers?k=v&v=k#top"sv, {}),
		  "scheme: https\n"
		  "authority: example.com:443\n"
		  "path: /r/rarepuppers\n"
		  "query: k=v&v=k\n"
		  "fragment: top\n");

	EXPECT_EQ(DissectToString("http://test.com"sv, {}),
		  "scheme: http\n"
		  "authority: test.com\n"
		  "path: /\n");
}

TEST(Dissect, Resource)
{
	const DissectOptions options{.mode = DissectMode::RESOURCE};

	EXPECT_EQ(DissectToString("/a/b/c#frag?param"sv, options),
		  "path: /a/b/c\n"
		  "fragment: frag?param\n");

	EXPECT_EQ(DissectToString("?#"sv, options),
		  "path: /\n");

	/* resources never fail */
	EXPECT_EQ(DissectToString("ftp://example.com"sv, options),
		  "path: ftp://example.com\n");
}

TEST(Dissect, Canonical)
{
	const DissectOptions options{.canonical = true};

	EXPECT_EQ(DissectToString("http://example.com"sv, options),
		  "http://example.com/\n");
	EXPECT_EQ(DissectToString("https://example.com/a?#b"sv, options),
		  "https://example.com/a#b\n");

	const DissectOptions resource_options{
		.mode = DissectMode::RESOURCE,
		.canonical = true,
	};

	EXPECT_EQ(DissectToString(""sv, resource_options), "/\n");
	EXPECT_EQ(DissectToString("/x?y#"sv, resource_options), "/x?y\n");
}

TEST(Dissect, Malformed)
{
	SetLogLevel(0);

	for (const auto s : {"http://"sv, "http:///"sv, "://example.com"sv,
			     "ftp://example.com"sv, "hyper.rs/"sv}) {
		EXPECT_EQ(DissectToString(s, {}, false),
			  "error: malformed URI\n");
		EXPECT_EQ(DissectToString(s, {.canonical = true}, false),
			  "error: malformed URI\n");
	}

	SetLogLevel(1);
}
