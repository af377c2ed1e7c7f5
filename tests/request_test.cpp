#include "minicurl/request.hpp"
#include "minicurl/url.hpp"
#include "minicurl/version.hpp"

#include <gtest/gtest.h>

using namespace minicurl;

TEST(Base64EncodeTest, PadsToGroupsOfFour)
{
    EXPECT_EQ(Base64Encode(""), "");
    EXPECT_EQ(Base64Encode("f"), "Zg==");
    EXPECT_EQ(Base64Encode("fo"), "Zm8=");
    EXPECT_EQ(Base64Encode("foo"), "Zm9v");
    EXPECT_EQ(Base64Encode("user:pass"), "dXNlcjpwYXNz");
    EXPECT_EQ(Base64Encode(std::string("\xff\xfe", 2)), "//4=");
}

TEST(NormalizeMethodTest, UpperCases)
{
    EXPECT_EQ(NormalizeMethod("post"), "POST");
    EXPECT_EQ(NormalizeMethod("Delete"), "DELETE");
}

TEST(SerializeRequestTest, MinimalGet)
{
    RequestSpec spec;
    std::string request = SerializeRequest(spec, ParseUrl("http://example.com/index.html"));
    EXPECT_EQ(request,
              "GET /index.html HTTP/1.1\r\n"
              "Host: example.com\r\n"
              "User-Agent: " MINICURL_USER_AGENT "\r\n"
              "Connection: close\r\n"
              "\r\n");
}

TEST(SerializeRequestTest, HostCarriesNonDefaultPort)
{
    RequestSpec spec;
    std::string request = SerializeRequest(spec, ParseUrl("https://example.com:8443/?q=1"));
    EXPECT_NE(request.find("GET /?q=1 HTTP/1.1\r\n"), std::string::npos);
    EXPECT_NE(request.find("Host: example.com:8443\r\n"), std::string::npos);
}

TEST(SerializeRequestTest, BodyGetsContentLengthAndComesLast)
{
    RequestSpec spec;
    spec.method = "POST";
    spec.headers.Add("Content-Type", "application/json");
    spec.body = "{\"key\":\"value\"}";
    std::string request = SerializeRequest(spec, ParseUrl("http://api.example.com/items"));

    EXPECT_EQ(request,
              "POST /items HTTP/1.1\r\n"
              "Host: api.example.com\r\n"
              "User-Agent: " MINICURL_USER_AGENT "\r\n"
              "Connection: close\r\n"
              "Content-Length: 15\r\n"
              "Content-Type: application/json\r\n"
              "\r\n"
              "{\"key\":\"value\"}");
}

TEST(SerializeRequestTest, EmptyBodyStillSendsContentLength)
{
    RequestSpec spec;
    spec.method = "PUT";
    spec.body = "";
    std::string request = SerializeRequest(spec, ParseUrl("http://example.com/"));
    EXPECT_NE(request.find("Content-Length: 0\r\n"), std::string::npos);
}

TEST(SerializeRequestTest, UserHeadersOverrideDefaults)
{
    RequestSpec spec;
    spec.headers.Add("User-Agent", "Mozilla/5.0");
    spec.headers.Add("host", "virtual.example.com");
    std::string request = SerializeRequest(spec, ParseUrl("http://10.0.0.1/"));

    EXPECT_EQ(request.find("User-Agent: " MINICURL_USER_AGENT), std::string::npos);
    EXPECT_EQ(request.find("Host: 10.0.0.1"), std::string::npos);
    EXPECT_NE(request.find("User-Agent: Mozilla/5.0\r\n"), std::string::npos);
    EXPECT_NE(request.find("host: virtual.example.com\r\n"), std::string::npos);
}

TEST(SerializeRequestTest, ConnectionCloseIsAlwaysForced)
{
    RequestSpec spec;
    spec.headers.Add("Connection", "keep-alive");
    std::string request = SerializeRequest(spec, ParseUrl("http://example.com/"));
    EXPECT_NE(request.find("Connection: close\r\n"), std::string::npos);
    EXPECT_EQ(request.find("keep-alive"), std::string::npos);
}

TEST(SerializeRequestTest, ComputedContentLengthReplacesUserValue)
{
    RequestSpec spec;
    spec.method = "POST";
    spec.headers.Add("Content-Length", "999");
    spec.body = "abc";
    std::string request = SerializeRequest(spec, ParseUrl("http://example.com/"));
    EXPECT_NE(request.find("Content-Length: 3\r\n"), std::string::npos);
    EXPECT_EQ(request.find("999"), std::string::npos);
}

TEST(SerializeRequestTest, BasicAuthBeforeUserHeaders)
{
    RequestSpec spec;
    spec.credentials = "user:pass";
    spec.headers.Add("Accept", "*/*");
    std::string request = SerializeRequest(spec, ParseUrl("https://api.example.com/"));

    size_t auth = request.find("Authorization: Basic dXNlcjpwYXNz\r\n");
    size_t accept = request.find("Accept: */*\r\n");
    ASSERT_NE(auth, std::string::npos);
    ASSERT_NE(accept, std::string::npos);
    EXPECT_LT(auth, accept);
}

TEST(SerializeRequestTest, UserAuthorizationWinsOverCredentials)
{
    RequestSpec spec;
    spec.credentials = "user:pass";
    spec.headers.Add("Authorization", "Bearer token");
    std::string request = SerializeRequest(spec, ParseUrl("http://example.com/"));
    EXPECT_EQ(request.find("Basic"), std::string::npos);
    EXPECT_NE(request.find("Authorization: Bearer token\r\n"), std::string::npos);
}

TEST(SerializeRequestTest, HeadDropsBody)
{
    RequestSpec spec;
    spec.method = "HEAD";
    spec.body = "ignored";
    std::string request = SerializeRequest(spec, ParseUrl("http://example.com/"));
    EXPECT_EQ(request.find("Content-Length"), std::string::npos);
    EXPECT_EQ(request.find("ignored"), std::string::npos);
    EXPECT_EQ(request.substr(request.size() - 4), "\r\n\r\n");
}

TEST(SerializeRequestTest, BinaryBodyIsUnmodified)
{
    RequestSpec spec;
    spec.method = "POST";
    spec.body = std::string("a\0b\r\nc", 6);
    std::string request = SerializeRequest(spec, ParseUrl("http://example.com/"));
    EXPECT_EQ(request.substr(request.size() - 6), *spec.body);
    EXPECT_NE(request.find("Content-Length: 6\r\n"), std::string::npos);
}
