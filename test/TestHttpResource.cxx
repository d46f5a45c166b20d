// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "httpuri/Resource.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

static void
ExpectResource(std::string_view s, std::string_view path,
	       std::optional<std::string_view> query,
	       std::optional<std::string_view> fragment)
{
	const auto r = HttpResource::Parse(s);
	EXPECT_EQ(r.path, path) << s;
	EXPECT_EQ(r.query, query) << s;
	EXPECT_EQ(r.fragment, fragment) << s;
}

TEST(HttpResource, Path)
{
	ExpectResource("/a/b/c"sv, "/a/b/c"sv, std::nullopt, std::nullopt);
	ExpectResource("/"sv, "/"sv, std::nullopt, std::nullopt);
	ExpectResource("/a/b/c/"sv, "/a/b/c/"sv, std::nullopt, std::nullopt);
}

TEST(HttpResource, Query)
{
	ExpectResource("/a/b/c?key=val"sv, "/a/b/c"sv, "key=val"sv, std::nullopt);
	ExpectResource("/shittydogs?lang=en"sv, "/shittydogs"sv, "lang=en"sv,
		       std::nullopt);

	/* only the first question mark is a delimiter */
	ExpectResource("/a?b?c"sv, "/a"sv, "b?c"sv, std::nullopt);
}

TEST(HttpResource, Fragment)
{
	ExpectResource("/a/b/c#frag"sv, "/a/b/c"sv, std::nullopt, "frag"sv);
	ExpectResource("/a#b#c"sv, "/a"sv, std::nullopt, "b#c"sv);
}

TEST(HttpResource, QueryAndFragment)
{
	ExpectResource("/a/b/c?key=val&param#frag"sv,
		       "/a/b/c"sv, "key=val&param"sv, "frag"sv);
	ExpectResource("/a/b/c/?key=val&param#frag"sv,
		       "/a/b/c/"sv, "key=val&param"sv, "frag"sv);
	ExpectResource("/a/b/c?key=d/e#frag/ment?param"sv,
		       "/a/b/c"sv, "key=d/e"sv, "frag/ment?param"sv);
	ExpectResource("/a?x#y?z"sv, "/a"sv, "x"sv, "y?z"sv);
}

/**
 * A question mark after the hash sign belongs to the fragment.
 */
TEST(HttpResource, QuestionMarkInFragment)
{
	ExpectResource("/a/b/c#frag?frag-param"sv,
		       "/a/b/c"sv, std::nullopt, "frag?frag-param"sv);
	ExpectResource("/a/b/c#frag?param&key=val"sv,
		       "/a/b/c"sv, std::nullopt, "frag?param&key=val"sv);
	ExpectResource("/a#y?z"sv, "/a"sv, std::nullopt, "y?z"sv);
	ExpectResource("#?"sv, "/"sv, std::nullopt, "?"sv);
	ExpectResource("/a#?x"sv, "/a"sv, std::nullopt, "?x"sv);
}

TEST(HttpResource, EmptyPath)
{
	EXPECT_EQ(HttpResource::Parse(""sv), HttpResource::Parse("/"sv));

	ExpectResource(""sv, "/"sv, std::nullopt, std::nullopt);
	ExpectResource("?key=val"sv, "/"sv, "key=val"sv, std::nullopt);
	ExpectResource("#frag"sv, "/"sv, std::nullopt, "frag"sv);
	ExpectResource("?key=val#frag"sv, "/"sv, "key=val"sv, "frag"sv);
}

TEST(HttpResource, EmptyQueryAndFragment)
{
	ExpectResource("?"sv, "/"sv, std::nullopt, std::nullopt);
	ExpectResource("#"sv, "/"sv, std::nullopt, std::nullopt);
	ExpectResource("?#"sv, "/"sv, std::nullopt, std::nullopt);
	ExpectResource("?key=val#"sv, "/"sv, "key=val"sv, std::nullopt);
	ExpectResource("?#frag"sv, "/"sv, std::nullopt, "frag"sv);
	ExpectResource("/a?"sv, "/a"sv, std::nullopt, std::nullopt);
	ExpectResource("/a#"sv, "/a"sv, std::nullopt, std::nullopt);
	ExpectResource("/a?#"sv, "/a"sv, std::nullopt, std::nullopt);
	ExpectResource("/a#?"sv, "/a"sv, std::nullopt, "?"sv);

	const auto r = HttpResource::Parse("/a?#"sv);
	EXPECT_FALSE(r.HasQuery());
	EXPECT_FALSE(r.HasFragment());
}

/**
 * All parts point into the input string.
 */
TEST(HttpResource, Borrowed)
{
	const std::string_view s = "/foo/bar?a=b#c"sv;
	const auto r = HttpResource::Parse(s);

	EXPECT_EQ(r.path.data(), s.data());
	ASSERT_TRUE(r.query);
	EXPECT_EQ(r.query->data(), s.data() + 9);
	ASSERT_TRUE(r.fragment);
	EXPECT_EQ(r.fragment->data(), s.data() + 13);
}
