#ifndef MINICURL_TESTS_FAKE_STREAM_HPP
#define MINICURL_TESTS_FAKE_STREAM_HPP

#include "minicurl/error.hpp"
#include "minicurl/stream.hpp"
#include "minicurl/url.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace minicurl {
namespace fakes {

// What happened to one FakeStream, kept alive after the stream is destroyed.
struct StreamRecord {
    std::string written;
    size_t delivered = 0;
    size_t read_calls = 0;
    size_t reads_after_close = 0;
    int close_calls = 0;
    bool destroyed = false;
};

// Serves a fixed byte string, at most `max_read` bytes per Read. When
// `error` is set it is thrown once the data is exhausted instead of
// reporting end of stream.
class FakeStream : public Stream {
public:
    explicit FakeStream(std::string data, size_t max_read = std::numeric_limits<size_t>::max(),
                        std::shared_ptr<StreamRecord> record = std::make_shared<StreamRecord>())
        : data_(std::move(data)), max_read_(max_read), record_(std::move(record))
    {
    }

    ~FakeStream() override { record_->destroyed = true; }

    size_t Read(char* buffer, size_t len) override
    {
        ++record_->read_calls;
        if (record_->close_calls > 0) {
            ++record_->reads_after_close;
        }
        size_t available = data_.size() - position_;
        if (available == 0 && error_) {
            throw HttpError(*error_, Stage::Body, "injected failure");
        }
        size_t n = std::min({len, max_read_, available});
        std::memcpy(buffer, data_.data() + position_, n);
        position_ += n;
        record_->delivered += n;
        return n;
    }

    void Write(const char* data, size_t len) override { record_->written.append(data, len); }

    void Close() override { ++record_->close_calls; }

    void FailWhenExhausted(ErrorKind kind) { error_ = kind; }

    const StreamRecord& record() const { return *record_; }

private:
    std::string data_;
    size_t position_ = 0;
    size_t max_read_;
    std::optional<ErrorKind> error_;
    std::shared_ptr<StreamRecord> record_;
};

// Hands out one FakeStream per Connect, serving the scripted responses in order.
class FakeConnector : public Connector {
public:
    void AddResponse(std::string raw) { responses_.push_back(std::move(raw)); }

    std::unique_ptr<Stream> Connect(const ParsedUrl& url) override
    {
        if (connects_.size() >= responses_.size()) {
            throw HttpError(ErrorKind::ConnectError, Stage::Connect, "no scripted response left");
        }
        auto record = std::make_shared<StreamRecord>();
        records_.push_back(record);
        connects_.push_back(url);
        return std::make_unique<FakeStream>(responses_[connects_.size() - 1],
                                            std::numeric_limits<size_t>::max(), record);
    }

    const std::vector<ParsedUrl>& connects() const { return connects_; }
    const StreamRecord& record(size_t hop) const { return *records_.at(hop); }

private:
    std::vector<std::string> responses_;
    std::vector<ParsedUrl> connects_;
    std::vector<std::shared_ptr<StreamRecord>> records_;
};

} // namespace fakes
} // namespace minicurl

#endif // MINICURL_TESTS_FAKE_STREAM_HPP
