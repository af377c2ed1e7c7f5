#ifndef MINICURL_ERROR_HPP
#define MINICURL_ERROR_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace minicurl {

enum class ErrorKind {
    InvalidUrl,
    ConnectError,
    TlsError,
    ReadTimeout,
    WriteTimeout,
    ReadError,
    WriteError,
    MalformedStatusLine,
    MalformedHeader,
    HeadersTooLarge,
    TruncatedBody,
    MalformedChunkSize,
    MalformedChunkTerminator,
    ResponseTooLarge,
    MissingRedirectTarget,
    TooManyRedirects,
};

// Where in the exchange a failure happened.
enum class Stage {
    Resolve,
    Connect,
    Send,
    StatusLine,
    Headers,
    Body,
    Redirect,
};

const char* ToString(ErrorKind kind);
const char* ToString(Stage stage);

// Every failure of a request attempt is reported as an HttpError. The
// connection of the attempt is already closed when one propagates.
class HttpError : public std::runtime_error {
public:
    HttpError(ErrorKind kind, Stage stage, const std::string& detail, size_t bytes_read = 0);

    ErrorKind kind() const { return kind_; }
    Stage stage() const { return stage_; }
    size_t bytes_read() const { return bytes_read_; }
    const std::string& detail() const { return detail_; }

private:
    ErrorKind kind_;
    Stage stage_;
    size_t bytes_read_;
    std::string detail_;
};

// Bad command-line input, raised before any network activity.
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace minicurl

#endif // MINICURL_ERROR_HPP
