#pragma once

#include "hexfire/hexgrid.hpp"
#include "hexfire/types.hpp"

#include <cstddef>
#include <istream>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace hexfire {

    struct CoverageKey {
        int resolution = 0;
        std::string day_label;
        CellId cell = 0;

        bool operator<(const CoverageKey &o) const {
            return std::tie(resolution, day_label, cell) < std::tie(o.resolution, o.day_label, o.cell);
        }
        bool operator==(const CoverageKey &o) const {
            return resolution == o.resolution && day_label == o.day_label && cell == o.cell;
        }
    };

    std::string ToString(const CoverageKey &key);

    struct CoverageReport {
        std::size_t aggregate_buckets = 0;
        std::size_t raw_buckets = 0;
        std::size_t missing = 0;
        std::vector<CoverageKey> missing_sample;

        bool ok() const { return missing == 0; }
    };

    // Checks that every aggregate bucket has at least one raw observation in the same
    // (resolution, day, cell). Read-only: it never touches a streaming run.
    class CoverageValidator {
      private:
        std::vector<int> resolutions_;
        std::set<CoverageKey> raw_;
        std::set<CoverageKey> aggregates_;

      public:
        // Throws std::invalid_argument on an empty list or an out-of-range resolution.
        explicit CoverageValidator(std::vector<int> resolutions = {1, 2, 3, 4});

        const std::vector<int> &resolutions() const { return resolutions_; }

        // Records the buckets a raw feature occupies: any feature with an entity id, a resolved
        // timestamp and a representative coordinate.
        void addRaw(const Feature &feature);

        // Records the buckets the aggregator would fold this feature into.
        void addAggregatesFrom(const Feature &feature);

        // Records an already-known aggregate bucket. Its resolution joins the checked set, so
        // record aggregates before raw features.
        void addAggregate(CoverageKey key);

        CoverageReport validate(std::size_t sample_limit = 5) const;
    };

    // Reads aggregate records (cell, res, day_label) from an NDJSON stream. Raw records and
    // blank lines are ignored. Throws std::runtime_error on a line that is not JSON.
    std::size_t ReadAggregateKeys(std::istream &in, CoverageValidator &validator);

} // namespace hexfire
