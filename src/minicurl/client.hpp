#ifndef MINICURL_CLIENT_HPP
#define MINICURL_CLIENT_HPP

#include "minicurl/request.hpp"
#include "minicurl/response_reader.hpp"
#include "minicurl/stream.hpp"
#include "minicurl/transport.hpp"
#include "minicurl/url.hpp"

#include <string>

namespace minicurl {

struct ClientOptions {
    bool follow_redirects = false;
    int max_redirects = 10;
    ReaderLimits limits;
    TransportOptions transport;
};

struct Result {
    Response response;
    // URL of the request that produced `response`.
    ParsedUrl effective_url;
    int redirects_followed = 0;
};

bool IsRedirectStatus(int code);

// The request to send for the next hop after a redirect with `code`.
// Switches to GET without a body for 303, and for 301/302 answering a POST;
// 307/308 keep method and body.
RequestSpec RedirectRequest(const RequestSpec& previous, int code);

class HttpClient {
public:
    HttpClient(Connector& connector, ClientOptions options);

    // Runs the exchange for `url`, following redirects when enabled. Each hop
    // uses its own connection, closed before the next hop starts.
    Result Execute(const std::string& url, const RequestSpec& spec);

private:
    Response PerformHop(const ParsedUrl& url, const RequestSpec& spec);

    Connector& connector_;
    ClientOptions options_;
};

} // namespace minicurl

#endif // MINICURL_CLIENT_HPP
