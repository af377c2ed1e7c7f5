#include "minicurl/response_reader.hpp"

#include "minicurl/log.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

#include <fmt/core.h>

using namespace std;

namespace minicurl {

namespace {

constexpr size_t kReadChunk = 8192;
constexpr size_t kMaxChunkSizeLine = 1024;

string Trim(const string& s)
{
    size_t begin = s.find_first_not_of(" \t");
    if (begin == string::npos) {
        return string();
    }
    return s.substr(begin, s.find_last_not_of(" \t") - begin + 1);
}

string ToLower(string s)
{
    transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(tolower(c)); });
    return s;
}

bool IsDigits(const string& s)
{
    return !s.empty() && all_of(s.begin(), s.end(), [](char c) { return isdigit(static_cast<unsigned char>(c)); });
}

bool ParseDecimal(const string& text, size_t& value)
{
    if (!IsDigits(text)) {
        return false;
    }
    value = 0;
    for (char c : text) {
        size_t digit = static_cast<size_t>(c - '0');
        if (value > (numeric_limits<size_t>::max() - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    return true;
}

bool ParseHex(const string& text, size_t& value)
{
    if (text.empty()) {
        return false;
    }
    value = 0;
    for (char c : text) {
        size_t digit;
        if (c >= '0' && c <= '9') {
            digit = static_cast<size_t>(c - '0');
        } else if (c >= 'a' && c <= 'f') {
            digit = static_cast<size_t>(c - 'a' + 10);
        } else if (c >= 'A' && c <= 'F') {
            digit = static_cast<size_t>(c - 'A' + 10);
        } else {
            return false;
        }
        if (value > (numeric_limits<size_t>::max() - digit) / 16) {
            return false;
        }
        value = value * 16 + digit;
    }
    return true;
}

} // namespace

string Response::HeadText() const
{
    string text = fmt::format("HTTP/{} {}", status.version, status.code);
    if (!status.reason.empty()) {
        text += " " + status.reason;
    }
    text += "\r\n";
    for (const auto& [name, value] : headers) {
        text += fmt::format("{}: {}\r\n", name, value);
    }
    text += "\r\n";
    return text;
}

BodyFraming DecideFraming(const string& method, int status_code, const HeaderMap& headers)
{
    if (method == "HEAD" || (status_code >= 100 && status_code < 200) ||
        status_code == 204 || status_code == 304) {
        return framing::NoBody{};
    }

    for (const string& encoding : headers.GetAll("Transfer-Encoding")) {
        if (ToLower(encoding).find("chunked") != string::npos) {
            return framing::Chunked{};
        }
    }

    vector<string> lengths = headers.GetAll("Content-Length");
    if (lengths.empty()) {
        return framing::UntilClose{};
    }
    size_t length = 0;
    for (size_t i = 0; i < lengths.size(); ++i) {
        size_t value = 0;
        if (!ParseDecimal(Trim(lengths[i]), value)) {
            throw HttpError(ErrorKind::MalformedHeader, Stage::Headers,
                            "Invalid Content-Length '" + lengths[i] + "'");
        }
        if (i > 0 && value != length) {
            throw HttpError(ErrorKind::MalformedHeader, Stage::Headers, "Conflicting Content-Length headers");
        }
        length = value;
    }
    return framing::ContentLength{length};
}

const char* ToString(ResponseReader::State state)
{
    switch (state) {
    case ResponseReader::State::StatusLine: return "StatusLine";
    case ResponseReader::State::Headers: return "Headers";
    case ResponseReader::State::Body: return "Body";
    case ResponseReader::State::Done: return "Done";
    case ResponseReader::State::Error: return "Error";
    }
    return "?";
}

ResponseReader::ResponseReader(Stream& stream, ReaderLimits limits)
    : stream_(stream), limits_(limits)
{
}

Response ResponseReader::Read(const string& method)
{
    Response response;

    ReadStatusLine(response.status);
    state_ = State::Headers;

    ReadHeaders(response.headers);

    BodyFraming body_framing;
    try {
        body_framing = DecideFraming(method, response.status.code, response.headers);
    } catch (const HttpError& e) {
        Fail(e.kind(), e.detail());
    }
    state_ = State::Body;

    ReadBody(body_framing, response.body);

    state_ = State::Done;
    stream_.Close();
    log::Verbose("Received {} bytes, {} body bytes", bytes_received_, response.body.size());
    return response;
}

void ResponseReader::ReadStatusLine(ResponseStatus& status)
{
    const string line = ReadLine(limits_.max_header_bytes, ErrorKind::MalformedStatusLine,
                                 ErrorKind::MalformedStatusLine, ErrorKind::MalformedStatusLine);
    log::Wire('<', line);

    // HTTP/<major>.<minor> SP <3 digits> [SP <reason>]
    size_t space = line.find(' ');
    if (line.compare(0, 5, "HTTP/") != 0 || space == string::npos) {
        Fail(ErrorKind::MalformedStatusLine, "Invalid status line '" + line + "'");
    }
    string version = line.substr(5, space - 5);
    if (version.size() != 3 || !isdigit(static_cast<unsigned char>(version[0])) || version[1] != '.' ||
        !isdigit(static_cast<unsigned char>(version[2]))) {
        Fail(ErrorKind::MalformedStatusLine, "Invalid protocol version in '" + line + "'");
    }

    string code = line.substr(space + 1, 3);
    size_t after_code = space + 4;
    if (code.size() != 3 || !IsDigits(code) || (line.size() > after_code && line[after_code] != ' ')) {
        Fail(ErrorKind::MalformedStatusLine, "Invalid status code in '" + line + "'");
    }
    status.code = stoi(code);
    if (status.code < 100 || status.code > 599) {
        Fail(ErrorKind::MalformedStatusLine, "Status code out of range in '" + line + "'");
    }
    status.version = version;
    status.reason = line.size() > after_code ? line.substr(after_code + 1) : string();
}

void ResponseReader::ReadHeaders(HeaderMap& headers)
{
    for (;;) {
        size_t remaining = limits_.max_header_bytes - min(header_bytes_, limits_.max_header_bytes);
        const string line = ReadLine(remaining, ErrorKind::MalformedHeader,
                                     ErrorKind::HeadersTooLarge, ErrorKind::MalformedHeader);
        header_bytes_ += line.size() + 2;
        if (line.empty()) {
            return;
        }
        log::Wire('<', line);

        size_t colon = line.find(':');
        if (colon == string::npos) {
            Fail(ErrorKind::MalformedHeader, "Header line without ':' '" + line + "'");
        }
        string name = line.substr(0, colon);
        if (name.empty() || name.find_first_of(" \t") != string::npos) {
            Fail(ErrorKind::MalformedHeader, "Invalid header name in '" + line + "'");
        }
        headers.Add(name, Trim(line.substr(colon + 1)));
    }
}

void ResponseReader::ReadBody(const BodyFraming& body_framing, string& body)
{
    if (holds_alternative<framing::NoBody>(body_framing)) {
        log::Verbose("Response has no body");
    } else if (auto* fixed = get_if<framing::ContentLength>(&body_framing)) {
        log::Verbose("Response Content-Length: {} bytes", fixed->length);
        size_t head_bytes = bytes_received_ - buffer_.size();
        if (fixed->length > limits_.max_response_size - min(head_bytes, limits_.max_response_size)) {
            Fail(ErrorKind::ResponseTooLarge,
                 fmt::format("Content-Length {} exceeds the {} byte limit", fixed->length, limits_.max_response_size));
        }
        ReadExact(fixed->length, body);
    } else if (holds_alternative<framing::Chunked>(body_framing)) {
        log::Verbose("Response uses chunked transfer encoding");
        ReadChunked(body);
    } else {
        log::Verbose("Response is delimited by connection close");
        ReadUntilClose(body);
    }
}

void ResponseReader::ReadExact(size_t length, string& body)
{
    size_t remaining = length;
    while (remaining > 0) {
        if (buffer_.empty() && Fill() == 0) {
            Fail(ErrorKind::TruncatedBody,
                 fmt::format("Connection closed with {} of {} body bytes missing", remaining, length));
        }
        size_t take = min(remaining, buffer_.size());
        body.append(buffer_, 0, take);
        buffer_.erase(0, take);
        remaining -= take;
    }
}

void ResponseReader::ReadChunked(string& body)
{
    for (;;) {
        string line = ReadLine(kMaxChunkSizeLine, ErrorKind::MalformedChunkSize,
                               ErrorKind::MalformedChunkSize, ErrorKind::TruncatedBody);
        string size_text = Trim(line.substr(0, line.find(';')));
        size_t chunk_size = 0;
        if (!ParseHex(size_text, chunk_size)) {
            Fail(ErrorKind::MalformedChunkSize, "Invalid chunk size line '" + line + "'");
        }
        if (chunk_size == 0) {
            ReadTrailer();
            return;
        }

        ReadExact(chunk_size, body);

        while (buffer_.size() < 2) {
            if (Fill() == 0) {
                Fail(ErrorKind::TruncatedBody, "Connection closed after chunk data");
            }
        }
        if (buffer_[0] != '\r' || buffer_[1] != '\n') {
            Fail(ErrorKind::MalformedChunkTerminator, "Chunk data not followed by CRLF");
        }
        buffer_.erase(0, 2);
    }
}

void ResponseReader::ReadTrailer()
{
    for (;;) {
        size_t remaining = limits_.max_header_bytes - min(header_bytes_, limits_.max_header_bytes);
        const string line = ReadLine(remaining, ErrorKind::MalformedHeader,
                                     ErrorKind::HeadersTooLarge, ErrorKind::TruncatedBody);
        header_bytes_ += line.size() + 2;
        if (line.empty()) {
            return;
        }
        log::Verbose("Discarding trailer '{}'", line);
    }
}

void ResponseReader::ReadUntilClose(string& body)
{
    do {
        body += buffer_;
        buffer_.clear();
    } while (Fill() > 0);
}

string ResponseReader::ReadLine(size_t max_length, ErrorKind on_malformed, ErrorKind on_too_long, ErrorKind on_eof)
{
    size_t searched = 0;
    for (;;) {
        size_t newline = buffer_.find('\n', searched);
        if (newline != string::npos) {
            if (newline + 1 > max_length) {
                Fail(on_too_long, fmt::format("Line longer than {} bytes", max_length));
            }
            if (newline == 0 || buffer_[newline - 1] != '\r') {
                Fail(on_malformed, "Line not terminated by CRLF");
            }
            string line = buffer_.substr(0, newline - 1);
            buffer_.erase(0, newline + 1);
            return line;
        }
        if (buffer_.size() >= max_length) {
            Fail(on_too_long, fmt::format("Line longer than {} bytes", max_length));
        }
        searched = buffer_.size();
        if (Fill() == 0) {
            Fail(on_eof, buffer_.empty() ? "Connection closed" : "Connection closed in the middle of a line");
        }
    }
}

size_t ResponseReader::Fill()
{
    // Never ask for more than one byte past the limit.
    size_t allowance = limits_.max_response_size - min(bytes_received_, limits_.max_response_size) + 1;
    char chunk[kReadChunk];
    size_t received = 0;
    try {
        received = stream_.Read(chunk, min(kReadChunk, allowance));
    } catch (const HttpError& e) {
        Fail(e.kind(), e.detail());
    }
    bytes_received_ += received;
    buffer_.append(chunk, received);
    if (bytes_received_ > limits_.max_response_size) {
        Fail(ErrorKind::ResponseTooLarge,
             fmt::format("Response exceeds the {} byte limit", limits_.max_response_size));
    }
    return received;
}

Stage ResponseReader::CurrentStage() const
{
    switch (state_) {
    case State::StatusLine: return Stage::StatusLine;
    case State::Headers: return Stage::Headers;
    default: return Stage::Body;
    }
}

void ResponseReader::Fail(ErrorKind kind, const string& detail)
{
    Stage stage = CurrentStage();
    state_ = State::Error;
    stream_.Close();
    throw HttpError(kind, stage, detail, bytes_received_);
}

} // namespace minicurl
