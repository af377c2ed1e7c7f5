#include "minicurl/error.hpp"
#include "minicurl/options.hpp"

#include <cstdio>
#include <fstream>

#include <gtest/gtest.h>

using namespace minicurl;

TEST(ParseArgumentsTest, DefaultsForBareUrl)
{
    CliOptions options = ParseArguments({"https://example.com"});
    EXPECT_EQ(options.url, "https://example.com");
    EXPECT_EQ(options.request.method, "GET");
    EXPECT_FALSE(options.request.body.has_value());
    EXPECT_FALSE(options.client.follow_redirects);
    EXPECT_EQ(options.client.max_redirects, 10);
    EXPECT_EQ(options.client.transport.min_tls_version, TlsVersion::Tls1_2);
    EXPECT_EQ(options.client.limits.max_response_size, 10u * 1024 * 1024);
    EXPECT_FALSE(options.output.has_value());
}

TEST(ParseArgumentsTest, FullRequest)
{
    CliOptions options = ParseArguments({"-X", "put", "-H", "Content-Type: application/json",
                                         "-H", "X-Trace: 1", "-d", "{}", "-u", "me:secret",
                                         "-A", "tester/1.0", "-L", "--max-redirs", "3",
                                         "-o", "out.json", "-i", "-v",
                                         "http://api.example.com/items"});
    EXPECT_EQ(options.request.method, "PUT");
    EXPECT_EQ(options.request.body.value(), "{}");
    EXPECT_EQ(options.request.credentials.value(), "me:secret");
    EXPECT_EQ(options.request.headers.Get("content-type").value(), "application/json");
    EXPECT_EQ(options.request.headers.Get("User-Agent").value(), "tester/1.0");
    EXPECT_EQ(options.request.headers.size(), 3u);
    EXPECT_TRUE(options.client.follow_redirects);
    EXPECT_EQ(options.client.max_redirects, 3);
    EXPECT_EQ(options.output.value(), "out.json");
    EXPECT_TRUE(options.include_headers);
    EXPECT_TRUE(options.verbose);
}

TEST(ParseArgumentsTest, DataWithoutMethodBecomesPost)
{
    EXPECT_EQ(ParseArguments({"-d", "a=1", "http://example.com"}).request.method, "POST");
    EXPECT_EQ(ParseArguments({"-d", "a=1", "-X", "PATCH", "http://example.com"}).request.method, "PATCH");
    EXPECT_EQ(ParseArguments({"-X", "GET", "-d", "a=1", "http://example.com"}).request.method, "GET");
}

TEST(ParseArgumentsTest, DataFromFile)
{
    const std::string path = ::testing::TempDir() + "minicurl_options_body.txt";
    {
        std::ofstream file(path, std::ios::binary);
        file << "line one\nline two\n";
    }
    CliOptions options = ParseArguments({"-d", "@" + path, "http://example.com"});
    EXPECT_EQ(options.request.body.value(), "line one\nline two\n");
    std::remove(path.c_str());

    EXPECT_THROW(ParseArguments({"-d", "@/nonexistent/minicurl/body", "http://example.com"}), UsageError);
}

TEST(ParseArgumentsTest, HeadOnly)
{
    CliOptions options = ParseArguments({"-I", "http://example.com"});
    EXPECT_TRUE(options.head_only);
    EXPECT_EQ(options.request.method, "HEAD");
}

TEST(ParseArgumentsTest, TlsVersionFromEnvironmentAndFlag)
{
    EXPECT_EQ(ParseArguments({"https://example.com"}, "1.3").client.transport.min_tls_version,
              TlsVersion::Tls1_3);
    EXPECT_EQ(ParseArguments({"--tls-version", "1.1", "https://example.com"}, "1.3")
                  .client.transport.min_tls_version,
              TlsVersion::Tls1_1);
    EXPECT_THROW(ParseArguments({"https://example.com"}, "9.9"), UsageError);
}

TEST(ParseArgumentsTest, TimeoutsAndLimits)
{
    CliOptions options = ParseArguments({"--connect-timeout", "2.5", "--max-time", "7",
                                         "--max-filesize", "4096", "-k", "https://example.com"});
    EXPECT_EQ(options.client.transport.connect_timeout.count(), 2500);
    EXPECT_EQ(options.client.transport.read_timeout.count(), 7000);
    EXPECT_EQ(options.client.transport.write_timeout.count(), 7000);
    EXPECT_EQ(options.client.limits.max_response_size, 4096u);
    EXPECT_FALSE(options.client.transport.verify_peer);
}

TEST(ParseArgumentsTest, HelpStopsParsing)
{
    CliOptions options = ParseArguments({"--help", "--bogus"});
    EXPECT_TRUE(options.help);
    EXPECT_NE(HelpText().find("--location"), std::string::npos);
}

TEST(ParseArgumentsTest, UsageErrors)
{
    EXPECT_THROW(ParseArguments({}), UsageError);
    EXPECT_THROW(ParseArguments({"-X"}), UsageError);
    EXPECT_THROW(ParseArguments({"--frobnicate", "http://example.com"}), UsageError);
    EXPECT_THROW(ParseArguments({"-H", "missing colon", "http://example.com"}), UsageError);
    EXPECT_THROW(ParseArguments({"--max-redirs", "-1", "http://example.com"}), UsageError);
    EXPECT_THROW(ParseArguments({"--max-time", "0", "http://example.com"}), UsageError);
    EXPECT_THROW(ParseArguments({"--connect-timeout", "abc", "http://example.com"}), UsageError);
    EXPECT_THROW(ParseArguments({"http://a.example", "http://b.example"}), UsageError);
}
