#include "hexfire/source.hpp"

#include "hexfire/log.hpp"
#include "hexfire/parser.hpp"
#include "hexfire/timestamp.hpp"

#include <algorithm>
#include <exception>
#include <regex>
#include <stdexcept>
#include <system_error>

namespace hexfire {

    std::optional<std::string> EntityIdFromFileName(const std::string &file_name) {
        static const std::regex kIdPattern(R"(^gdf_(\d+)\.geojson$)");
        std::smatch m;
        if (!std::regex_match(file_name, m, kIdPattern))
            return std::nullopt;
        return m[1].str();
    }

    std::optional<TimeRange> CollectionTimeRange(const FeatureCollection &fc) {
        std::optional<TimeRange> range;
        for (auto const &f : fc.features) {
            auto ts = ParseTimestamp(ResolveTimeField(f.properties));
            if (!ts)
                continue;
            if (!range) {
                range = TimeRange{*ts, *ts};
            } else {
                range->min_ts = std::min(range->min_ts, *ts);
                range->max_ts = std::max(range->max_ts, *ts);
            }
        }
        return range;
    }

    FeatureSource::FeatureSource(const std::filesystem::path &dir) {
        namespace fs = std::filesystem;

        std::error_code ec;
        if (!fs::exists(dir, ec))
            throw std::runtime_error("input directory not found: " + dir.string());
        if (!fs::is_directory(dir, ec))
            throw std::runtime_error("input path is not a directory: " + dir.string());

        for (auto const &entry : fs::directory_iterator(dir, ec)) {
            if (!entry.is_regular_file(ec))
                continue;
            if (entry.path().extension() != ".geojson")
                continue;
            files_.push_back(entry.path());
        }
        if (ec)
            throw std::runtime_error("failed listing directory " + dir.string() + ": " + ec.message());

        std::sort(files_.begin(), files_.end(),
                  [](auto const &a, auto const &b) { return a.filename().string() < b.filename().string(); });
        log()->debug("{} source files in {}", files_.size(), dir.string());
    }

    bool FeatureSource::openNextFile() {
        while (next_file_ < files_.size()) {
            auto const &path = files_[next_file_++];
            try {
                auto fc = ReadFeatureCollection(path);
                auto tf = MakeTransform(fc);
                current_ = std::move(fc);
                transform_ = std::move(tf);
            } catch (const std::exception &e) {
                ++files_skipped_;
                log()->warn("Skipping {}: {}", path.filename().string(), e.what());
                continue;
            }
            ++files_read_;
            next_feature_ = 0;
            file_id_ = EntityIdFromFileName(path.filename().string());
            file_range_ = CollectionTimeRange(current_);
            log()->debug("{}: {} features{}", path.filename().string(), current_.features.size(),
                         transform_ ? " (reprojected)" : "");
            return true;
        }
        return false;
    }

    std::optional<Feature> FeatureSource::next() {
        for (;;) {
            if (next_feature_ < current_.features.size()) {
                Feature f = std::move(current_.features[next_feature_++]);

                if (file_id_ && !f.properties.id_declared) {
                    f.properties.id_fire_event = file_id_;
                    if (file_range_) {
                        f.properties.time_min_ts = file_range_->min_ts;
                        f.properties.time_max_ts = file_range_->max_ts;
                        f.properties.time_min = FormatTimestamp(file_range_->min_ts);
                        f.properties.time_max = FormatTimestamp(file_range_->max_ts);
                    }
                }

                if (transform_ && f.geometry) {
                    try {
                        f.geometry = TransformGeometry(*f.geometry, *transform_);
                    } catch (const std::exception &e) {
                        log()->debug("dropping geometry that failed to reproject: {}", e.what());
                        f.geometry.reset();
                    }
                }
                return f;
            }

            current_ = FeatureCollection{};
            transform_.reset();
            if (!openNextFile())
                return std::nullopt;
        }
    }

} // namespace hexfire
