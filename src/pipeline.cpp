#include "hexfire/pipeline.hpp"

#include "hexfire/log.hpp"
#include "hexfire/source.hpp"
#include "hexfire/timestamp.hpp"

namespace hexfire {

    Feature PrepareRaw(const Feature &feature, const StatsOverlay &stats) {
        Feature out{feature.geometry, stats.apply(feature.properties)};
        auto &props = out.properties;

        if (auto time = ResolveTime(props)) {
            auto day = DayBucketFor(time->epoch);
            props.time_ts = time->epoch;
            props.day_start_ts = day.start;
            props.day_end_ts = day.end;
            if (props.time_floor)
                props.time = props.time_floor;
        }
        return out;
    }

    StreamReport RunStream(const StreamOptions &options, NdjsonSink &sink) {
        StreamReport report;
        FeatureSource source(options.data_dir);

        StatsOverlay stats;
        if (options.stats_path)
            stats = StatsOverlay::load(*options.stats_path);

        std::optional<SpatialAggregator> aggregator;
        if (!options.raw_only)
            aggregator.emplace(options.resolution);
        bool const emit_raw = options.raw_only || options.include_raw;

        std::optional<int> minzoom;
        if (!options.raw_only)
            minzoom = options.highZoomMin();

        Emitter emitter(sink);

        while (auto feature = source.next()) {
            if (!feature->properties.id_fire_event)
                continue;

            if (options.range.active() && !options.range.admits(ParseTimestamp(ResolveTimeField(feature->properties)))) {
                ++report.filtered;
                continue;
            }

            if (aggregator)
                aggregator->add(*feature);

            if (emit_raw) {
                if (emitter.writeRaw(PrepareRaw(*feature, stats), minzoom) == WriteStatus::kClosed) {
                    report.interrupted = true;
                    break;
                }
                ++report.raw_written;
            }
        }

        if (!report.interrupted && aggregator) {
            auto table = aggregator->release();
            for (auto const &entry : table) {
                if (emitter.writeAggregate(entry.second, options.low_zoom_max) == WriteStatus::kClosed) {
                    report.interrupted = true;
                    break;
                }
                ++report.aggregates_written;
            }
        }

        if (!report.interrupted && emitter.flush() == WriteStatus::kClosed)
            report.interrupted = true;

        report.files_read = source.filesRead();
        report.files_skipped = source.filesSkipped();

        if (report.interrupted)
            log()->debug("output closed early, stopping");
        log()->info("files read {}, files skipped {}, raw written {}, filtered {}, aggregates written {}",
                    report.files_read, report.files_skipped, report.raw_written, report.filtered,
                    report.aggregates_written);
        return report;
    }

} // namespace hexfire
