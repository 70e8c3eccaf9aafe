#include "hexfire/coverage.hpp"

#include "hexfire/aggregator.hpp"
#include "hexfire/timestamp.hpp"

#include <algorithm>
#include <boost/json.hpp>
#include <stdexcept>

namespace hexfire {

    std::string ToString(const CoverageKey &key) {
        return "(" + std::to_string(key.resolution) + ", " + key.day_label + ", " + CellToString(key.cell) + ")";
    }

    CoverageValidator::CoverageValidator(std::vector<int> resolutions) : resolutions_(std::move(resolutions)) {
        if (resolutions_.empty())
            throw std::invalid_argument("at least one resolution is required");
        for (int res : resolutions_) {
            if (!IsValidResolution(res))
                throw std::invalid_argument("H3 resolution must be within 0..15, got " + std::to_string(res));
        }
        std::sort(resolutions_.begin(), resolutions_.end());
        resolutions_.erase(std::unique(resolutions_.begin(), resolutions_.end()), resolutions_.end());
    }

    void CoverageValidator::addRaw(const Feature &feature) {
        if (!feature.properties.id_fire_event || !feature.geometry)
            return;
        auto time = ResolveTime(feature.properties);
        if (!time)
            return;
        auto where = RepresentativeCoordinate(*feature.geometry);
        if (!where)
            return;

        auto label = DayBucketFor(time->epoch).label;
        for (int res : resolutions_) {
            if (auto cell = CellAt(where->y, where->x, res))
                raw_.insert(CoverageKey{res, label, *cell});
        }
    }

    void CoverageValidator::addAggregatesFrom(const Feature &feature) {
        for (int res : resolutions_) {
            if (auto obs = Observe(feature, res))
                aggregates_.insert(CoverageKey{res, obs->day.label, obs->key.cell});
        }
    }

    void CoverageValidator::addAggregate(CoverageKey key) {
        if (!IsValidResolution(key.resolution))
            throw std::invalid_argument("H3 resolution must be within 0..15, got " + std::to_string(key.resolution));
        auto pos = std::lower_bound(resolutions_.begin(), resolutions_.end(), key.resolution);
        if (pos == resolutions_.end() || *pos != key.resolution)
            resolutions_.insert(pos, key.resolution);
        aggregates_.insert(std::move(key));
    }

    CoverageReport CoverageValidator::validate(std::size_t sample_limit) const {
        CoverageReport report;
        report.aggregate_buckets = aggregates_.size();
        report.raw_buckets = raw_.size();
        for (auto const &key : aggregates_) {
            if (raw_.count(key))
                continue;
            ++report.missing;
            if (report.missing_sample.size() < sample_limit)
                report.missing_sample.push_back(key);
        }
        return report;
    }

    std::size_t ReadAggregateKeys(std::istream &in, CoverageValidator &validator) {
        std::size_t added = 0;
        std::size_t line_no = 0;
        std::string line;
        while (std::getline(in, line)) {
            ++line_no;
            if (line.find_first_not_of(" \t\r") == std::string::npos)
                continue;

            boost::system::error_code ec;
            auto doc = boost::json::parse(line, ec);
            if (ec)
                throw std::runtime_error("hexfire::ReadAggregateKeys(): line " + std::to_string(line_no) + ": " +
                                         ec.message());

            auto const *feat = doc.if_object();
            auto const *props_v = feat ? feat->if_contains("properties") : nullptr;
            auto const *props = props_v ? props_v->if_object() : nullptr;
            if (!props)
                continue;

            auto const *cell_v = props->if_contains("cell");
            auto const *res_v = props->if_contains("res");
            auto const *day_v = props->if_contains("day_label");
            if (!cell_v || !cell_v->is_string() || !res_v || !res_v->is_int64() || !day_v || !day_v->is_string())
                continue;

            auto cell = CellFromString(std::string(cell_v->as_string()));
            if (!cell)
                throw std::runtime_error("hexfire::ReadAggregateKeys(): line " + std::to_string(line_no) +
                                         ": invalid cell " + std::string(cell_v->as_string()));
            try {
                validator.addAggregate(
                    CoverageKey{static_cast<int>(res_v->as_int64()), std::string(day_v->as_string()), *cell});
            } catch (const std::invalid_argument &e) {
                throw std::runtime_error("hexfire::ReadAggregateKeys(): line " + std::to_string(line_no) + ": " +
                                         e.what());
            }
            ++added;
        }
        return added;
    }

} // namespace hexfire
