#ifndef MINICURL_REQUEST_HPP
#define MINICURL_REQUEST_HPP

#include "minicurl/headers.hpp"
#include "minicurl/url.hpp"

#include <optional>
#include <string>

namespace minicurl {

struct RequestSpec {
    std::string method = "GET";
    HeaderMap headers;
    std::optional<std::string> body;
    // "user:pass" for Basic authentication.
    std::optional<std::string> credentials;

    bool IsHead() const { return method == "HEAD"; }
};

std::string NormalizeMethod(const std::string& method);

std::string Base64Encode(const std::string& data);

// Produces the exact bytes written to the connection. A body given with a
// HEAD request is dropped.
std::string SerializeRequest(const RequestSpec& spec, const ParsedUrl& url);

} // namespace minicurl

#endif // MINICURL_REQUEST_HPP
