#pragma once

#include "hexfire/aggregator.hpp"
#include "hexfire/emitter.hpp"
#include "hexfire/stats.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace hexfire {

    struct StreamOptions {
        std::filesystem::path data_dir = "GeoJson";
        int resolution = 3;
        int low_zoom_max = 4;
        std::optional<int> high_zoom_min;
        bool include_raw = true;
        bool raw_only = false;
        DateRange range;
        std::optional<std::filesystem::path> stats_path;

        int highZoomMin() const { return high_zoom_min.value_or(low_zoom_max + 1); }
    };

    struct StreamReport {
        std::size_t files_read = 0;
        std::size_t files_skipped = 0;
        std::size_t raw_written = 0;
        std::size_t filtered = 0;
        std::size_t aggregates_written = 0;
        bool interrupted = false; // the consumer closed the output early
    };

    // Raw output form of a feature: stats overrides merged in, plus the derived time fields
    // when a timestamp resolves.
    Feature PrepareRaw(const Feature &feature, const StatsOverlay &stats);

    // Streams raw features as they are read, then every aggregate once the input is exhausted.
    // Throws when the input directory is unusable or the sink fails for a reason other than closure.
    StreamReport RunStream(const StreamOptions &options, NdjsonSink &sink);

} // namespace hexfire
