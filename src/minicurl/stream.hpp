#ifndef MINICURL_STREAM_HPP
#define MINICURL_STREAM_HPP

#include "minicurl/url.hpp"

#include <cstddef>
#include <memory>

namespace minicurl {

// A blocking, owned byte stream to one peer.
class Stream {
public:
    virtual ~Stream() = default;

    // Reads up to `len` bytes. Returns 0 once the peer has closed the stream.
    virtual size_t Read(char* buffer, size_t len) = 0;

    // Writes all `len` bytes or throws.
    virtual void Write(const char* data, size_t len) = 0;

    // Releases the underlying resource. Safe to call more than once.
    virtual void Close() = 0;
};

// Opens one fresh stream per request attempt.
class Connector {
public:
    virtual ~Connector() = default;

    virtual std::unique_ptr<Stream> Connect(const ParsedUrl& url) = 0;
};

} // namespace minicurl

#endif // MINICURL_STREAM_HPP
