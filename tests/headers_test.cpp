#include "minicurl/error.hpp"
#include "minicurl/headers.hpp"

#include <gtest/gtest.h>

using namespace minicurl;

TEST(HeaderMapTest, LookupIgnoresCase)
{
    HeaderMap headers;
    headers.Add("Content-Type", "text/html");
    EXPECT_TRUE(headers.Contains("content-type"));
    EXPECT_EQ(headers.Get("CONTENT-TYPE").value(), "text/html");
    EXPECT_FALSE(headers.Get("X-Missing").has_value());
}

TEST(HeaderMapTest, KeepsDuplicatesInOrder)
{
    HeaderMap headers;
    headers.Add("Set-Cookie", "a=1");
    headers.Add("X-Other", "x");
    headers.Add("set-cookie", "b=2");

    std::vector<std::string> cookies = headers.GetAll("SET-COOKIE");
    ASSERT_EQ(cookies.size(), 2u);
    EXPECT_EQ(cookies[0], "a=1");
    EXPECT_EQ(cookies[1], "b=2");

    auto it = headers.begin();
    EXPECT_EQ(it->first, "Set-Cookie");
    ++it;
    EXPECT_EQ(it->first, "X-Other");
    ++it;
    EXPECT_EQ(it->first, "set-cookie");
}

TEST(HeaderMapTest, SetReplacesAllAtFirstPosition)
{
    HeaderMap headers;
    headers.Add("Accept", "text/html");
    headers.Add("X-Trace", "1");
    headers.Add("accept", "application/json");
    headers.Set("ACCEPT", "*/*");

    ASSERT_EQ(headers.size(), 2u);
    EXPECT_EQ(headers.begin()->first, "ACCEPT");
    EXPECT_EQ(headers.begin()->second, "*/*");
    EXPECT_EQ(headers.GetAll("accept").size(), 1u);
}

TEST(HeaderMapTest, RemoveDropsEveryMatch)
{
    HeaderMap headers;
    headers.Add("Authorization", "Bearer a");
    headers.Add("authorization", "Bearer b");
    headers.Add("Accept", "*/*");
    EXPECT_EQ(headers.Remove("AUTHORIZATION"), 2u);
    EXPECT_EQ(headers.size(), 1u);
    EXPECT_EQ(headers.Remove("Authorization"), 0u);
}

TEST(ParseHeaderLineTest, SplitsOnFirstColonAndTrims)
{
    auto [name, value] = ParseHeaderLine("X-Time:  12:30:00 \t");
    EXPECT_EQ(name, "X-Time");
    EXPECT_EQ(value, "12:30:00");
}

TEST(ParseHeaderLineTest, EmptyValueIsAllowed)
{
    auto [name, value] = ParseHeaderLine("X-Empty:");
    EXPECT_EQ(name, "X-Empty");
    EXPECT_EQ(value, "");
}

TEST(ParseHeaderLineTest, RejectsLineWithoutName)
{
    EXPECT_THROW(ParseHeaderLine("no colon here"), UsageError);
    EXPECT_THROW(ParseHeaderLine(": value"), UsageError);
}
