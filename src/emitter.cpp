#include "hexfire/emitter.hpp"

#include "hexfire/log.hpp"

#include <boost/json.hpp>
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace hexfire {

    FdSink::FdSink(int fd, std::size_t capacity) : fd_(fd), capacity_(capacity) { buffer_.reserve(capacity_); }

    FdSink::~FdSink() {
        try {
            flush();
        } catch (const std::system_error &e) {
            log()->error("final flush failed: {}", e.what());
        }
    }

    WriteStatus FdSink::writeLine(const std::string &line) {
        if (closed_)
            return WriteStatus::kClosed;
        buffer_ += line;
        buffer_ += '\n';
        if (buffer_.size() >= capacity_)
            return flush();
        return WriteStatus::kOk;
    }

    WriteStatus FdSink::flush() {
        if (closed_)
            return WriteStatus::kClosed;
        std::size_t off = 0;
        while (off < buffer_.size()) {
            ssize_t n = ::write(fd_, buffer_.data() + off, buffer_.size() - off);
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                if (errno == EPIPE) {
                    closed_ = true;
                    buffer_.clear();
                    return WriteStatus::kClosed;
                }
                int err = errno;
                buffer_.clear();
                throw std::system_error(err, std::generic_category(), "write to output failed");
            }
            off += static_cast<std::size_t>(n);
        }
        buffer_.clear();
        return WriteStatus::kOk;
    }

    WriteStatus StreamSink::writeLine(const std::string &line) {
        out_ << line << '\n';
        if (!out_)
            throw std::runtime_error("hexfire::StreamSink::writeLine(): output stream failed");
        return WriteStatus::kOk;
    }

    WriteStatus StreamSink::flush() {
        out_.flush();
        if (!out_)
            throw std::runtime_error("hexfire::StreamSink::flush(): output stream failed");
        return WriteStatus::kOk;
    }

    WriteStatus Emitter::put(const std::string &line) {
        if (closed_)
            return WriteStatus::kClosed;
        if (sink_.writeLine(line) == WriteStatus::kClosed) {
            closed_ = true;
            log()->debug("output closed by consumer");
            return WriteStatus::kClosed;
        }
        ++written_;
        return WriteStatus::kOk;
    }

    WriteStatus Emitter::writeRaw(const Feature &feature, std::optional<int> minzoom) {
        std::optional<ZoomHint> hint;
        if (minzoom)
            hint = ZoomHint{*minzoom, std::nullopt};
        return put(boost::json::serialize(featureToJson(feature, hint)));
    }

    WriteStatus Emitter::writeAggregate(const Aggregate &agg, int maxzoom) {
        return put(boost::json::serialize(aggregateToJson(agg, maxzoom)));
    }

    WriteStatus Emitter::flush() {
        if (closed_)
            return WriteStatus::kClosed;
        if (sink_.flush() == WriteStatus::kClosed) {
            closed_ = true;
            return WriteStatus::kClosed;
        }
        return WriteStatus::kOk;
    }

} // namespace hexfire
