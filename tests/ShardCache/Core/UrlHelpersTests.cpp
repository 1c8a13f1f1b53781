// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Core/UrlHelpers.hpp"

#include <gtest/gtest.h>
using ShardCache::Core::UrlHelpers;

TEST(UrlHelpersTests, Parse_SplitsAllComponents)
{
    // Act
    const auto parsed = UrlHelpers::Parse("HTTPS://Example.com:8443/a/b.tar?sig=1&x=2#part");

    // Assert
    EXPECT_EQ("https", parsed.scheme);
    EXPECT_EQ("Example.com:8443", parsed.authority);
    EXPECT_EQ("/a/b.tar", parsed.path);
    EXPECT_EQ("sig=1&x=2", parsed.query);
    EXPECT_EQ("part", parsed.fragment);
}

TEST(UrlHelpersTests, Parse_BarePathHasNoScheme)
{
    const auto absolute = UrlHelpers::Parse("/data/shards/a.tar");
    EXPECT_EQ("", absolute.scheme);
    EXPECT_EQ("", absolute.authority);
    EXPECT_EQ("/data/shards/a.tar", absolute.path);

    const auto relative = UrlHelpers::Parse("shards/a:b.tar");
    EXPECT_EQ("", relative.scheme);
    EXPECT_EQ("shards/a:b.tar", relative.path);
}

TEST(UrlHelpersTests, Parse_FileUrl)
{
    const auto parsed = UrlHelpers::Parse("file:///tmp/a.tar");
    EXPECT_EQ("file", parsed.scheme);
    EXPECT_EQ("", parsed.authority);
    EXPECT_EQ("/tmp/a.tar", parsed.path);
}

TEST(UrlHelpersTests, Parse_AuthorityWithoutPath)
{
    const auto parsed = UrlHelpers::Parse("http://host");
    EXPECT_EQ("host", parsed.authority);
    EXPECT_EQ("", parsed.path);
}

TEST(UrlHelpersTests, IsLocal)
{
    EXPECT_TRUE(UrlHelpers::IsLocal("/tmp/a.tar"));
    EXPECT_TRUE(UrlHelpers::IsLocal("a.tar"));
    EXPECT_TRUE(UrlHelpers::IsLocal("file:///tmp/a.tar"));
    EXPECT_TRUE(UrlHelpers::IsLocal("FILE:/tmp/a.tar"));
    EXPECT_FALSE(UrlHelpers::IsLocal("http://host/a.tar"));
    EXPECT_FALSE(UrlHelpers::IsLocal("az://container/a.tar"));
    EXPECT_FALSE(UrlHelpers::IsLocal("pipe:cat a.tar"));
}

TEST(UrlHelpersTests, Quote)
{
    EXPECT_EQ("a%20b/c.tar", UrlHelpers::Quote("a b/c.tar"));
    EXPECT_EQ("a%20b%2Fc.tar", UrlHelpers::Quote("a b/c.tar", ""));
    EXPECT_EQ("%C3%BC~_.-", UrlHelpers::Quote("\xc3\xbc~_.-"));
    EXPECT_EQ("k%3Dv", UrlHelpers::Quote("k=v"));
}
