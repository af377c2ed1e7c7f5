#include "minicurl/transport.hpp"

#include "minicurl/error.hpp"
#include "minicurl/log.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>

using namespace std;

namespace minicurl {

namespace {

long CurlSslVersion(TlsVersion version)
{
    switch (version) {
    case TlsVersion::Tls1_0: return CURL_SSLVERSION_TLSv1_0;
    case TlsVersion::Tls1_1: return CURL_SSLVERSION_TLSv1_1;
    case TlsVersion::Tls1_2: return CURL_SSLVERSION_TLSv1_2;
    case TlsVersion::Tls1_3: return CURL_SSLVERSION_TLSv1_3;
    }
    return CURL_SSLVERSION_TLSv1_2;
}

bool IsTlsFailure(CURLcode res)
{
    switch (res) {
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_SSL_ENGINE_NOTFOUND:
    case CURLE_SSL_ENGINE_SETFAILED:
    case CURLE_SSL_CERTPROBLEM:
    case CURLE_SSL_CIPHER:
    case CURLE_SSL_CACERT_BADFILE:
    case CURLE_SSL_ISSUER_ERROR:
    case CURLE_SSL_PINNEDPUBKEYNOTMATCH:
    case CURLE_SSL_INVALIDCERTSTATUS:
    case CURLE_SSL_CRL_BADFILE:
    case CURLE_SSL_SHUTDOWN_FAILED:
    case CURLE_USE_SSL_FAILED:
        return true;
    default:
        return false;
    }
}

} // namespace

TlsVersion ParseTlsVersion(const string& text)
{
    if (text == "1.0") return TlsVersion::Tls1_0;
    if (text == "1.1") return TlsVersion::Tls1_1;
    if (text == "1.2") return TlsVersion::Tls1_2;
    if (text == "1.3") return TlsVersion::Tls1_3;
    throw UsageError("Unsupported TLS version '" + text + "' (expected 1.0, 1.1, 1.2 or 1.3)");
}

const char* ToString(TlsVersion version)
{
    switch (version) {
    case TlsVersion::Tls1_0: return "1.0";
    case TlsVersion::Tls1_1: return "1.1";
    case TlsVersion::Tls1_2: return "1.2";
    case TlsVersion::Tls1_3: return "1.3";
    }
    return "?";
}

CurlGlobal::CurlGlobal()
{
    CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (res != CURLE_OK) {
        throw runtime_error(string("curl_global_init() failed: ") + curl_easy_strerror(res));
    }
}

CurlGlobal::~CurlGlobal()
{
    curl_global_cleanup();
}

unique_ptr<Connection> Connection::Open(const ParsedUrl& url, const TransportOptions& options)
{
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw HttpError(ErrorKind::ConnectError, Stage::Connect, "Failed to initialize libcurl");
    }
    // Owns the handle from here on, so every failure below releases it.
    auto connection = make_unique<Connection>(PrivateTag{}, curl, options);

    const bool encrypted = url.scheme == Scheme::Encrypted;
    const string endpoint = string(encrypted ? "https://" : "http://") + url.Authority() + "/";
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_PROXY, "");
    // Keeps ALPN from negotiating h2, which the hand-written exchange cannot speak.
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    if (encrypted) {
        curl_easy_setopt(curl, CURLOPT_SSLVERSION, CurlSslVersion(options.min_tls_version));
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.verify_peer ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.verify_peer ? 2L : 0L);
    }

    log::Verbose("Connecting to {}:{} ({})...", url.host, url.port, encrypted ? "HTTPS" : "HTTP");
    if (encrypted) {
        log::Verbose("Using minimum TLS version: {}", ToString(options.min_tls_version));
    }

    CURLcode res = curl_easy_perform(curl);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, nullptr);
    if (res != CURLE_OK) {
        string detail = error_buffer[0] ? error_buffer : curl_easy_strerror(res);
        detail += " (" + url.Authority() + ")";
        ErrorKind kind = encrypted && IsTlsFailure(res) ? ErrorKind::TlsError : ErrorKind::ConnectError;
        throw HttpError(kind, Stage::Connect, detail);
    }

    log::Verbose("Connected to {}", url.Authority());
    return connection;
}

Connection::Connection(PrivateTag, CURL* curl, const TransportOptions& options)
    : curl_(curl), options_(options)
{
}

Connection::~Connection()
{
    Close();
}

void Connection::Close()
{
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
}

bool Connection::WaitSocket(short events, chrono::milliseconds timeout)
{
    const bool reading = (events & POLLIN) != 0;
    auto fail = [&](const string& detail) {
        Close();
        if (reading) {
            throw HttpError(ErrorKind::ReadError, Stage::Body, detail);
        }
        throw HttpError(ErrorKind::WriteError, Stage::Send, detail);
    };

    curl_socket_t sockfd = CURL_SOCKET_BAD;
    if (curl_easy_getinfo(curl_, CURLINFO_ACTIVESOCKET, &sockfd) != CURLE_OK || sockfd == CURL_SOCKET_BAD) {
        fail("Connection socket is no longer available");
    }

    pollfd pfd{};
    pfd.fd = sockfd;
    pfd.events = events;
    int rc;
    do {
        rc = poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) {
        fail(string("poll failed: ") + strerror(errno));
    }
    return rc > 0;
}

size_t Connection::Read(char* buffer, size_t len)
{
    if (!curl_) {
        throw HttpError(ErrorKind::ReadError, Stage::Body, "Connection already closed");
    }
    for (;;) {
        size_t received = 0;
        CURLcode res = curl_easy_recv(curl_, buffer, len, &received);
        if (res == CURLE_OK) {
            return received;
        }
        if (res != CURLE_AGAIN) {
            Close();
            throw HttpError(ErrorKind::ReadError, Stage::Body, curl_easy_strerror(res));
        }
        if (!WaitSocket(POLLIN, options_.read_timeout)) {
            Close();
            throw HttpError(ErrorKind::ReadTimeout, Stage::Body,
                            "No data within " + to_string(options_.read_timeout.count()) + " ms");
        }
    }
}

void Connection::Write(const char* data, size_t len)
{
    if (!curl_) {
        throw HttpError(ErrorKind::WriteError, Stage::Send, "Connection already closed");
    }
    size_t sent_total = 0;
    while (sent_total < len) {
        size_t sent = 0;
        CURLcode res = curl_easy_send(curl_, data + sent_total, len - sent_total, &sent);
        if (res == CURLE_OK) {
            sent_total += sent;
            continue;
        }
        if (res != CURLE_AGAIN) {
            Close();
            throw HttpError(ErrorKind::WriteError, Stage::Send, curl_easy_strerror(res));
        }
        if (!WaitSocket(POLLOUT, options_.write_timeout)) {
            Close();
            throw HttpError(ErrorKind::WriteTimeout, Stage::Send,
                            "Socket not writable within " + to_string(options_.write_timeout.count()) + " ms");
        }
    }
}

unique_ptr<Stream> CurlConnector::Connect(const ParsedUrl& url)
{
    return Connection::Open(url, options_);
}

} // namespace minicurl
