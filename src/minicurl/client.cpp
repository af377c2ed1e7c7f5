#include "minicurl/client.hpp"

#include "minicurl/error.hpp"
#include "minicurl/log.hpp"

#include <memory>
#include <optional>
#include <utility>

using namespace std;

namespace minicurl {

namespace {

bool SameOrigin(const ParsedUrl& a, const ParsedUrl& b)
{
    return a.scheme == b.scheme && EqualsNoCase(a.host, b.host) && a.port == b.port;
}

void LogRequestHead(const string& request)
{
    size_t head_end = request.find("\r\n\r\n");
    size_t begin = 0;
    while (begin < head_end) {
        size_t end = request.find("\r\n", begin);
        log::Wire('>', request.substr(begin, end - begin));
        begin = end + 2;
    }
}

} // namespace

bool IsRedirectStatus(int code)
{
    return code == 301 || code == 302 || code == 303 || code == 307 || code == 308;
}

RequestSpec RedirectRequest(const RequestSpec& previous, int code)
{
    RequestSpec next = previous;
    bool to_get = (code == 303 && !previous.IsHead()) ||
                  ((code == 301 || code == 302) && previous.method == "POST");
    if (to_get) {
        next.method = "GET";
        next.body.reset();
        next.headers.Remove("Content-Length");
    }
    return next;
}

HttpClient::HttpClient(Connector& connector, ClientOptions options)
    : connector_(connector), options_(std::move(options))
{
}

Result HttpClient::Execute(const string& url, const RequestSpec& spec)
{
    Result result;
    result.effective_url = ParseUrl(url);
    RequestSpec current = spec;
    current.method = NormalizeMethod(current.method);
    int remaining = options_.max_redirects;

    for (;;) {
        result.response = PerformHop(result.effective_url, current);

        const int code = result.response.status.code;
        if (!options_.follow_redirects || !IsRedirectStatus(code)) {
            return result;
        }

        optional<string> location = result.response.headers.Get("Location");
        if (!location || location->empty()) {
            throw HttpError(ErrorKind::MissingRedirectTarget, Stage::Redirect,
                            "Status " + to_string(code) + " without a Location header");
        }
        if (remaining <= 0) {
            throw HttpError(ErrorKind::TooManyRedirects, Stage::Redirect,
                            "Maximum of " + to_string(options_.max_redirects) + " redirects reached");
        }
        --remaining;

        ParsedUrl next_url = ResolveLocation(result.effective_url, *location);
        RequestSpec next = RedirectRequest(current, code);
        if (!SameOrigin(result.effective_url, next_url)) {
            // Credentials stay with the host they were meant for.
            next.credentials.reset();
            next.headers.Remove("Authorization");
        }

        log::Verbose("Following redirect ({}) to: {}", code, next_url.ToString());
        result.effective_url = next_url;
        current = std::move(next);
        ++result.redirects_followed;
    }
}

Response HttpClient::PerformHop(const ParsedUrl& url, const RequestSpec& spec)
{
    unique_ptr<Stream> stream = connector_.Connect(url);

    const string request = SerializeRequest(spec, url);
    LogRequestHead(request);
    try {
        stream->Write(request.data(), request.size());
    } catch (const HttpError& e) {
        stream->Close();
        throw HttpError(e.kind(), Stage::Send, e.detail());
    }
    log::Verbose("Request sent ({} bytes), waiting for response...", request.size());

    ResponseReader reader(*stream, options_.limits);
    return reader.Read(spec.method);
}

} // namespace minicurl
