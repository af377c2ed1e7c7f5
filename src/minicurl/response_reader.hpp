#ifndef MINICURL_RESPONSE_READER_HPP
#define MINICURL_RESPONSE_READER_HPP

#include "minicurl/error.hpp"
#include "minicurl/headers.hpp"
#include "minicurl/stream.hpp"

#include <cstddef>
#include <string>
#include <variant>

namespace minicurl {

struct ResponseStatus {
    std::string version = "1.1";
    int code = 0;
    std::string reason;
};

struct Response {
    ResponseStatus status;
    HeaderMap headers;
    std::string body;

    // Status line and header block as they would appear on the wire.
    std::string HeadText() const;
};

namespace framing {
struct NoBody {};
struct ContentLength {
    size_t length;
};
struct Chunked {};
struct UntilClose {};
} // namespace framing

using BodyFraming = std::variant<framing::NoBody, framing::ContentLength, framing::Chunked, framing::UntilClose>;

// Chooses how the body of a response is delimited. Throws
// HttpError(MalformedHeader) for an unusable Content-Length.
BodyFraming DecideFraming(const std::string& method, int status_code, const HeaderMap& headers);

struct ReaderLimits {
    size_t max_response_size = 10 * 1024 * 1024;
    size_t max_header_bytes = 64 * 1024;
};

// Reads exactly one HTTP/1.1 response from a stream, moving through
// StatusLine -> Headers -> Body -> Done. Any failure moves it to Error.
// The stream is closed when the reader reaches Done or Error.
class ResponseReader {
public:
    enum class State {
        StatusLine,
        Headers,
        Body,
        Done,
        Error,
    };

    ResponseReader(Stream& stream, ReaderLimits limits);

    // `method` is the method of the request this response answers.
    Response Read(const std::string& method);

    State state() const { return state_; }

    // Raw bytes taken from the stream so far, framing included.
    size_t bytes_received() const { return bytes_received_; }

private:
    void ReadStatusLine(ResponseStatus& status);
    void ReadHeaders(HeaderMap& headers);
    void ReadBody(const BodyFraming& framing, std::string& body);
    void ReadExact(size_t length, std::string& body);
    void ReadChunked(std::string& body);
    void ReadTrailer();
    void ReadUntilClose(std::string& body);

    // Returns one CRLF-terminated line without its terminator.
    std::string ReadLine(size_t max_length, ErrorKind on_malformed, ErrorKind on_too_long, ErrorKind on_eof);

    // Pulls more bytes into the buffer. Returns 0 when the peer has closed.
    size_t Fill();

    Stage CurrentStage() const;
    [[noreturn]] void Fail(ErrorKind kind, const std::string& detail);

    Stream& stream_;
    ReaderLimits limits_;
    State state_ = State::StatusLine;
    std::string buffer_;
    size_t bytes_received_ = 0;
    size_t header_bytes_ = 0;
};

const char* ToString(ResponseReader::State state);

} // namespace minicurl

#endif // MINICURL_RESPONSE_READER_HPP
