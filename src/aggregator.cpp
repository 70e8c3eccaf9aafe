#include "hexfire/aggregator.hpp"

#include <algorithm>
#include <stdexcept>
#include <type_traits>

namespace hexfire {

    std::optional<double> NormalizeFros(std::optional<double> fros) {
        if (!fros || *fros <= kFrosMissingThreshold)
            return std::nullopt;
        return fros;
    }

    namespace {

        struct Centroid {
            double sum_x = 0.0;
            double sum_y = 0.0;
            std::size_t n = 0;

            void add(const Position &p) {
                sum_x += p.x;
                sum_y += p.y;
                ++n;
            }
            void add(const std::vector<Position> &pts) {
                for (auto const &p : pts)
                    add(p);
            }
            void add(const Polygon &poly) {
                for (auto const &ring : poly.rings)
                    add(ring);
            }
        };

    } // namespace

    std::optional<Position> RepresentativeCoordinate(const Geometry &geom) {
        if (auto const *pt = std::get_if<Point>(&geom))
            return Position{pt->position.x, pt->position.y, {}};

        Centroid c;
        std::visit(
            [&](auto const &shape) {
                using T = std::decay_t<decltype(shape)>;
                if constexpr (std::is_same_v<T, MultiPoint> || std::is_same_v<T, LineString>) {
                    c.add(shape.positions);
                } else if constexpr (std::is_same_v<T, MultiLineString>) {
                    for (auto const &line : shape.lines)
                        c.add(line);
                } else if constexpr (std::is_same_v<T, Polygon>) {
                    c.add(shape);
                } else if constexpr (std::is_same_v<T, MultiPolygon>) {
                    for (auto const &poly : shape.polygons)
                        c.add(poly);
                }
            },
            geom);

        if (c.n == 0)
            return std::nullopt;
        return Position{c.sum_x / static_cast<double>(c.n), c.sum_y / static_cast<double>(c.n), {}};
    }

    std::optional<Observation> Observe(const Feature &feature, int res) {
        auto const &props = feature.properties;
        if (!props.id_fire_event || props.invalid_frp || !feature.geometry)
            return std::nullopt;

        auto time = ResolveTime(props);
        if (!time)
            return std::nullopt;

        auto where = RepresentativeCoordinate(*feature.geometry);
        if (!where)
            return std::nullopt;

        auto cell = CellAt(where->y, where->x, res);
        if (!cell)
            return std::nullopt;

        Observation obs;
        obs.day = DayBucketFor(time->epoch);
        obs.key = AggregateKey{res, *cell, obs.day.start};
        obs.entity_id = *props.id_fire_event;
        obs.raw_time = std::move(time->raw);
        obs.frp = props.frp.value_or(0.0);
        obs.fros = NormalizeFros(props.fros);
        return obs;
    }

    SpatialAggregator::SpatialAggregator(int resolution) : resolution_(resolution) {
        if (!IsValidResolution(resolution))
            throw std::invalid_argument("H3 resolution must be within 0..15, got " + std::to_string(resolution));
    }

    bool SpatialAggregator::add(const Feature &feature) {
        auto obs = Observe(feature, resolution_);
        if (!obs)
            return false;
        fold(*obs);
        return true;
    }

    void SpatialAggregator::fold(const Observation &obs) {
        auto [it, created] = table_.try_emplace(obs.key);
        Aggregate &agg = it->second;
        if (created) {
            agg.key = obs.key;
            agg.day_label = obs.day.label;
            agg.day_end = obs.day.end;
        }

        // Sums and count once per entity; maxima see every replicate.
        if (agg.entity_ids.insert(obs.entity_id).second) {
            agg.count += 1;
            agg.frp_sum += obs.frp;
            agg.fre_sum += obs.frp * kFreIntervalSeconds;
            if (obs.fros) {
                agg.fros_sum += *obs.fros;
                agg.fros_count += 1;
            }
        }
        agg.frp_max = std::max(agg.frp_max, obs.frp);
        if (obs.fros)
            agg.fros_max = std::max(agg.fros_max, *obs.fros);
        agg.last_time = obs.raw_time;
    }

} // namespace hexfire
