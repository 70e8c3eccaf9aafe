#pragma once

#include "hexfire/crs.hpp"
#include "hexfire/types.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hexfire {

    // Entity id encoded in a file name of the form gdf_<digits>.geojson.
    std::optional<std::string> EntityIdFromFileName(const std::string &file_name);

    struct TimeRange {
        double min_ts = 0.0;
        double max_ts = 0.0;
    };

    // Min/max over the resolvable timestamps of a collection; nullopt when none resolves.
    std::optional<TimeRange> CollectionTimeRange(const FeatureCollection &fc);

    // Walks *.geojson files of a directory in lexical order and yields one normalized feature at a time.
    // Unreadable files are logged and skipped. The coordinate transformer lives for one file only.
    class FeatureSource {
      private:
        std::vector<std::filesystem::path> files_;
        std::size_t next_file_ = 0;

        FeatureCollection current_;
        std::size_t next_feature_ = 0;
        std::unique_ptr<CoordinateTransform> transform_;
        std::optional<std::string> file_id_;
        std::optional<TimeRange> file_range_;

        std::size_t files_read_ = 0;
        std::size_t files_skipped_ = 0;

        bool openNextFile();

      public:
        // Throws std::runtime_error when dir is missing or not a directory.
        explicit FeatureSource(const std::filesystem::path &dir);

        const std::vector<std::filesystem::path> &files() const { return files_; }

        std::optional<Feature> next();

        std::size_t filesRead() const { return files_read_; }
        std::size_t filesSkipped() const { return files_skipped_; }
    };

} // namespace hexfire
