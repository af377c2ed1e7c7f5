#ifndef MINICURL_TRANSPORT_HPP
#define MINICURL_TRANSPORT_HPP

#include "minicurl/stream.hpp"
#include "minicurl/url.hpp"

#include <chrono>
#include <memory>
#include <string>

#include <curl/curl.h>

namespace minicurl {

enum class TlsVersion {
    Tls1_0,
    Tls1_1,
    Tls1_2,
    Tls1_3,
};

// Accepts "1.0", "1.1", "1.2" and "1.3". Throws UsageError otherwise.
TlsVersion ParseTlsVersion(const std::string& text);
const char* ToString(TlsVersion version);

struct TransportOptions {
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds read_timeout{30000};
    std::chrono::milliseconds write_timeout{10000};
    TlsVersion min_tls_version = TlsVersion::Tls1_2;
    bool verify_peer = true;
};

// Process-wide libcurl setup; create one in main before any Connection.
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

// A TCP or TLS connection established by libcurl in connect-only mode.
// libcurl performs resolution, the handshake, SNI and certificate checks;
// the HTTP exchange itself is written and parsed by minicurl.
class Connection : public Stream {
public:
    // Throws HttpError(ConnectError) or HttpError(TlsError).
    static std::unique_ptr<Connection> Open(const ParsedUrl& url, const TransportOptions& options);

    ~Connection() override;

private:
    struct PrivateTag {};

public:
    // Only reachable through Open().
    Connection(PrivateTag, CURL* curl, const TransportOptions& options);

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    size_t Read(char* buffer, size_t len) override;
    void Write(const char* data, size_t len) override;
    void Close() override;

    bool IsOpen() const { return curl_ != nullptr; }

private:
    // Waits until the socket is readable or writable. False on timeout.
    // Throws ReadError or WriteError, matching the direction, if the socket
    // cannot be obtained or polled.
    bool WaitSocket(short events, std::chrono::milliseconds timeout);

    CURL* curl_;
    TransportOptions options_;
};

class CurlConnector : public Connector {
public:
    explicit CurlConnector(TransportOptions options) : options_(options) {}

    std::unique_ptr<Stream> Connect(const ParsedUrl& url) override;

private:
    TransportOptions options_;
};

} // namespace minicurl

#endif // MINICURL_TRANSPORT_HPP
