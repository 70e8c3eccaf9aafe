#pragma once

#include "hexfire/hexgrid.hpp"
#include "hexfire/timestamp.hpp"
#include "hexfire/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace hexfire {

    // FRE is FRP integrated over a fixed 10-minute observation window, whatever the real cadence.
    constexpr double kFreIntervalSeconds = 600.0;

    // FROS values at or below this are the missing-data sentinel (-999 in practice).
    constexpr double kFrosMissingThreshold = -900.0;

    std::optional<double> NormalizeFros(std::optional<double> fros);

    // Point coordinate for a Point; mean of every position for anything else. nullopt when empty.
    std::optional<Position> RepresentativeCoordinate(const Geometry &geom);

    // Half-open [start, end) epoch range; either side may be open.
    struct DateRange {
        std::optional<std::int64_t> start;
        std::optional<std::int64_t> end;

        bool active() const { return start.has_value() || end.has_value(); }

        bool contains(double ts) const {
            if (start && ts < static_cast<double>(*start))
                return false;
            if (end && ts >= static_cast<double>(*end))
                return false;
            return true;
        }

        // Unresolved timestamps are never filtered out.
        bool admits(const std::optional<double> &ts) const { return !ts || contains(*ts); }
    };

    struct AggregateKey {
        int resolution = 0;
        CellId cell = 0;
        std::int64_t day_start = 0;

        bool operator==(const AggregateKey &o) const {
            return resolution == o.resolution && cell == o.cell && day_start == o.day_start;
        }
    };

    struct AggregateKeyHash {
        std::size_t operator()(const AggregateKey &k) const noexcept {
            std::size_t h = std::hash<CellId>{}(k.cell);
            h ^= std::hash<std::int64_t>{}(k.day_start) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
            h ^= std::hash<int>{}(k.resolution) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
            return h;
        }
    };

    struct Aggregate {
        AggregateKey key;
        std::string day_label;
        std::int64_t day_end = 0;

        std::int64_t count = 0;
        double frp_sum = 0.0;
        double frp_max = 0.0;
        double fre_sum = 0.0;
        double fros_sum = 0.0;
        double fros_max = 0.0;
        std::int64_t fros_count = 0;
        std::optional<std::string> last_time;

        // Entities already counted in this bucket; dedup only, never emitted.
        std::unordered_set<std::string> entity_ids;

        double frpMean() const { return count ? frp_sum / static_cast<double>(count) : 0.0; }
        double freMean() const { return count ? fre_sum / static_cast<double>(count) : 0.0; }
        std::optional<double> frosMean() const {
            if (!fros_count)
                return std::nullopt;
            return fros_sum / static_cast<double>(fros_count);
        }
    };

    using AggregateTable = std::unordered_map<AggregateKey, Aggregate, AggregateKeyHash>;

    // Everything a feature contributes to one bucket, once it is known to be eligible.
    struct Observation {
        AggregateKey key;
        DayBucket day;
        std::string entity_id;
        std::string raw_time;
        double frp = 0.0;
        std::optional<double> fros;
    };

    // Eligibility rule shared by the aggregator and the coverage check: entity id, resolved
    // timestamp, representative coordinate, a cell at res, and readable numeric fields.
    std::optional<Observation> Observe(const Feature &feature, int res);

    class SpatialAggregator {
      private:
        int resolution_;
        AggregateTable table_;

      public:
        explicit SpatialAggregator(int resolution);

        int resolution() const { return resolution_; }

        // Folds one feature. Returns false when the feature cannot be aggregated.
        bool add(const Feature &feature);

        void fold(const Observation &obs);

        const AggregateTable &table() const { return table_; }
        std::size_t size() const { return table_.size(); }

        // Hands the accumulated buckets over; the aggregator is empty afterwards.
        AggregateTable release() { return std::exchange(table_, AggregateTable{}); }
    };

} // namespace hexfire
