#pragma once

#include "hexfire/aggregator.hpp"
#include "hexfire/writter.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

namespace hexfire {

    enum class WriteStatus { kOk, kClosed };

    // Line-oriented output. kClosed means the consumer went away; any other failure throws.
    class NdjsonSink {
      public:
        virtual ~NdjsonSink() = default;
        virtual WriteStatus writeLine(const std::string &line) = 0;
        virtual WriteStatus flush() = 0;
    };

    // Buffered POSIX writes to a file descriptor. EPIPE is reported as kClosed; SIGPIPE
    // must be ignored by the process for that to happen.
    class FdSink final : public NdjsonSink {
      private:
        int fd_;
        std::string buffer_;
        std::size_t capacity_;
        bool closed_ = false;

      public:
        explicit FdSink(int fd, std::size_t capacity = 1 << 16);
        ~FdSink() override;

        FdSink(const FdSink &) = delete;
        FdSink &operator=(const FdSink &) = delete;

        WriteStatus writeLine(const std::string &line) override;
        WriteStatus flush() override;
    };

    // std::ostream has no notion of a consumer going away, so every stream failure throws.
    class StreamSink final : public NdjsonSink {
      private:
        std::ostream &out_;

      public:
        explicit StreamSink(std::ostream &out) : out_(out) {}

        WriteStatus writeLine(const std::string &line) override;
        WriteStatus flush() override;
    };

    // Serializes features one per line. Once the sink reports kClosed every later write is a no-op.
    class Emitter {
      private:
        NdjsonSink &sink_;
        bool closed_ = false;
        std::size_t written_ = 0;

        WriteStatus put(const std::string &line);

      public:
        explicit Emitter(NdjsonSink &sink) : sink_(sink) {}

        WriteStatus writeRaw(const Feature &feature, std::optional<int> minzoom);
        WriteStatus writeAggregate(const Aggregate &agg, int maxzoom);
        WriteStatus flush();

        bool closed() const { return closed_; }
        std::size_t written() const { return written_; }
    };

} // namespace hexfire
