#ifndef MINICURL_URL_HPP
#define MINICURL_URL_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace minicurl {

enum class Scheme {
    Plain,      // http
    Encrypted,  // https
};

uint16_t DefaultPort(Scheme scheme);

struct ParsedUrl {
    Scheme scheme = Scheme::Plain;
    std::string host;
    uint16_t port = 80;
    std::string path = "/";
    std::optional<std::string> query;

    bool IsDefaultPort() const { return port == DefaultPort(scheme); }

    // "path?query" as it appears in the request line.
    std::string Target() const;

    // "host" or "host:port" when the port is not the scheme default.
    std::string Authority() const;

    std::string ToString() const;
};

bool operator==(const ParsedUrl& a, const ParsedUrl& b);
bool operator!=(const ParsedUrl& a, const ParsedUrl& b);

// Parses an absolute http:// or https:// URL. Throws HttpError(InvalidUrl).
ParsedUrl ParseUrl(const std::string& url);

// Resolves a Location header value against the URL that produced it.
ParsedUrl ResolveLocation(const ParsedUrl& base, const std::string& location);

} // namespace minicurl

#endif // MINICURL_URL_HPP
