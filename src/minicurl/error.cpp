#include "minicurl/error.hpp"

#include <fmt/core.h>

using namespace std;

namespace minicurl {

const char* ToString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::InvalidUrl: return "InvalidUrl";
    case ErrorKind::ConnectError: return "ConnectError";
    case ErrorKind::TlsError: return "TlsError";
    case ErrorKind::ReadTimeout: return "ReadTimeout";
    case ErrorKind::WriteTimeout: return "WriteTimeout";
    case ErrorKind::ReadError: return "ReadError";
    case ErrorKind::WriteError: return "WriteError";
    case ErrorKind::MalformedStatusLine: return "MalformedStatusLine";
    case ErrorKind::MalformedHeader: return "MalformedHeader";
    case ErrorKind::HeadersTooLarge: return "HeadersTooLarge";
    case ErrorKind::TruncatedBody: return "TruncatedBody";
    case ErrorKind::MalformedChunkSize: return "MalformedChunkSize";
    case ErrorKind::MalformedChunkTerminator: return "MalformedChunkTerminator";
    case ErrorKind::ResponseTooLarge: return "ResponseTooLarge";
    case ErrorKind::MissingRedirectTarget: return "MissingRedirectTarget";
    case ErrorKind::TooManyRedirects: return "TooManyRedirects";
    }
    return "Unknown";
}

const char* ToString(Stage stage)
{
    switch (stage) {
    case Stage::Resolve: return "resolve";
    case Stage::Connect: return "connect";
    case Stage::Send: return "send";
    case Stage::StatusLine: return "status line";
    case Stage::Headers: return "headers";
    case Stage::Body: return "body";
    case Stage::Redirect: return "redirect";
    }
    return "unknown";
}

HttpError::HttpError(ErrorKind kind, Stage stage, const string& detail, size_t bytes_read)
    : runtime_error(fmt::format("{} during {}: {} ({} bytes read)",
                                ToString(kind), ToString(stage), detail, bytes_read)),
      kind_(kind), stage_(stage), bytes_read_(bytes_read), detail_(detail)
{
}

} // namespace minicurl
