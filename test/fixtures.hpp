#pragma once

#include "hexfire/emitter.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace hexfire::test {

    // Scratch directory under /tmp, removed with everything in it when the fixture goes away.
    class TempDir {
      private:
        std::filesystem::path path_;

      public:
        explicit TempDir(const std::string &name) {
            static std::atomic<int> counter{0};
            path_ = std::filesystem::temp_directory_path() /
                    ("hexfire_" + name + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
            std::filesystem::remove_all(path_);
            std::filesystem::create_directories(path_);
        }
        ~TempDir() {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const { return path_; }

        std::filesystem::path write(const std::string &file_name, const std::string &content) const {
            auto file = path_ / file_name;
            std::ofstream ofs(file);
            ofs << content;
            return file;
        }
    };

    // Accepts a fixed number of lines, then behaves like a pipe whose reader has gone away.
    class ClosingSink final : public NdjsonSink {
      private:
        std::size_t limit_;
        std::vector<std::string> lines_;

      public:
        explicit ClosingSink(std::size_t limit) : limit_(limit) {}

        WriteStatus writeLine(const std::string &line) override {
            if (lines_.size() >= limit_)
                return WriteStatus::kClosed;
            lines_.push_back(line);
            return WriteStatus::kOk;
        }
        WriteStatus flush() override { return lines_.size() >= limit_ ? WriteStatus::kClosed : WriteStatus::kOk; }

        const std::vector<std::string> &lines() const { return lines_; }
    };

    // Feature collection with one Point feature per (lon, lat, properties-json) entry.
    inline std::string PointCollection(const std::string &features_json, const std::string &crs = "") {
        std::string head = R"({"type": "FeatureCollection",)";
        if (!crs.empty())
            head += R"( "crs": {"type": "name", "properties": {"name": ")" + crs + R"("}},)";
        return head + R"( "features": [)" + features_json + "]}";
    }

    inline std::string PointFeature(double lon, double lat, const std::string &props_json) {
        return R"({"type": "Feature", "geometry": {"type": "Point", "coordinates": [)" + std::to_string(lon) +
               ", " + std::to_string(lat) + R"(]}, "properties": )" + props_json + "}";
    }

} // namespace hexfire::test
