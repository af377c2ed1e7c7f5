#include "minicurl/request.hpp"

#include "minicurl/version.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>

#include <fmt/core.h>

using namespace std;

namespace minicurl {

string NormalizeMethod(const string& method)
{
    string upper = method;
    transform(upper.begin(), upper.end(), upper.begin(),
              [](unsigned char c) { return static_cast<char>(toupper(c)); });
    return upper;
}

string Base64Encode(const string& data)
{
    static const char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    string encoded;
    encoded.reserve((data.size() + 2) / 3 * 4);
    for (size_t i = 0; i < data.size(); i += 3) {
        size_t remaining = data.size() - i;
        uint32_t group = static_cast<uint8_t>(data[i]) << 16;
        if (remaining > 1) {
            group |= static_cast<uint8_t>(data[i + 1]) << 8;
        }
        if (remaining > 2) {
            group |= static_cast<uint8_t>(data[i + 2]);
        }
        encoded += kAlphabet[(group >> 18) & 0x3f];
        encoded += kAlphabet[(group >> 12) & 0x3f];
        encoded += remaining > 1 ? kAlphabet[(group >> 6) & 0x3f] : '=';
        encoded += remaining > 2 ? kAlphabet[group & 0x3f] : '=';
    }
    return encoded;
}

string SerializeRequest(const RequestSpec& spec, const ParsedUrl& url)
{
    const HeaderMap& user = spec.headers;
    const bool send_body = spec.body.has_value() && !spec.IsHead();

    string request = fmt::format("{} {} HTTP/1.1\r\n", spec.method, url.Target());

    if (!user.Contains("Host")) {
        request += fmt::format("Host: {}\r\n", url.Authority());
    }
    if (!user.Contains("User-Agent")) {
        request += "User-Agent: " MINICURL_USER_AGENT "\r\n";
    }
    request += "Connection: close\r\n";
    if (send_body) {
        request += fmt::format("Content-Length: {}\r\n", spec.body->size());
    }
    if (spec.credentials && !user.Contains("Authorization")) {
        request += fmt::format("Authorization: Basic {}\r\n", Base64Encode(*spec.credentials));
    }

    for (const auto& [name, value] : user) {
        if (EqualsNoCase(name, "Connection")) {
            continue;
        }
        if (send_body && EqualsNoCase(name, "Content-Length")) {
            continue;
        }
        request += fmt::format("{}: {}\r\n", name, value);
    }
    request += "\r\n";

    if (send_body) {
        request += *spec.body;
    }
    return request;
}

} // namespace minicurl
