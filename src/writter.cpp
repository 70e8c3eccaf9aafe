#include "hexfire/writter.hpp"

#include "hexfire/hexgrid.hpp"

#include <boost/json.hpp>
#include <cmath>
#include <type_traits>

namespace hexfire {

    double Round3(double v) { return std::round(v * 1000.0) / 1000.0; }

    namespace {

        boost::json::array ptCoords(Position const &p) {
            boost::json::array arr;
            arr.push_back(p.x);
            arr.push_back(p.y);
            for (double e : p.extra)
                arr.push_back(e);
            return arr;
        }

        boost::json::array lineCoords(std::vector<Position> const &pts) {
            boost::json::array arr;
            for (auto const &p : pts)
                arr.push_back(ptCoords(p));
            return arr;
        }

        boost::json::array polygonCoords(Polygon const &poly) {
            boost::json::array rings;
            for (auto const &ring : poly.rings)
                rings.push_back(lineCoords(ring));
            return rings;
        }

        template <typename T> void put(boost::json::object &obj, const char *key, std::optional<T> const &v) {
            if (v)
                obj[key] = *v;
        }

    } // namespace

    boost::json::value geometryToJson(Geometry const &geom) {
        return std::visit(
            [&](auto const &shape) -> boost::json::value {
                using T = std::decay_t<decltype(shape)>;
                boost::json::object j;
                if constexpr (std::is_same_v<T, Point>) {
                    j["type"] = "Point";
                    j["coordinates"] = ptCoords(shape.position);
                } else if constexpr (std::is_same_v<T, MultiPoint>) {
                    j["type"] = "MultiPoint";
                    j["coordinates"] = lineCoords(shape.positions);
                } else if constexpr (std::is_same_v<T, LineString>) {
                    j["type"] = "LineString";
                    j["coordinates"] = lineCoords(shape.positions);
                } else if constexpr (std::is_same_v<T, MultiLineString>) {
                    j["type"] = "MultiLineString";
                    boost::json::array lines;
                    for (auto const &line : shape.lines)
                        lines.push_back(lineCoords(line));
                    j["coordinates"] = std::move(lines);
                } else if constexpr (std::is_same_v<T, Polygon>) {
                    j["type"] = "Polygon";
                    j["coordinates"] = polygonCoords(shape);
                } else if constexpr (std::is_same_v<T, MultiPolygon>) {
                    j["type"] = "MultiPolygon";
                    boost::json::array polys;
                    for (auto const &poly : shape.polygons)
                        polys.push_back(polygonCoords(poly));
                    j["coordinates"] = std::move(polys);
                }
                return j;
            },
            geom);
    }

    boost::json::object propertiesToJson(FireProperties const &p) {
        boost::json::object props;
        put(props, "id_fire_event", p.id_fire_event);
        put(props, "frp", p.frp);
        put(props, "fros", p.fros);
        put(props, "duration", p.duration);
        put(props, "time", p.time);
        put(props, "time_floor", p.time_floor);
        put(props, "timestamp", p.timestamp);
        put(props, "time_ts", p.time_ts);
        put(props, "time_min", p.time_min);
        put(props, "time_max", p.time_max);
        put(props, "time_min_ts", p.time_min_ts);
        put(props, "time_max_ts", p.time_max_ts);
        put(props, "day_start_ts", p.day_start_ts);
        put(props, "day_end_ts", p.day_end_ts);
        return props;
    }

    boost::json::object featureToJson(Feature const &f, std::optional<ZoomHint> const &hint) {
        boost::json::object j;
        j["type"] = "Feature";
        auto props = propertiesToJson(f.properties);
        if (hint) {
            boost::json::object zoom;
            zoom["minzoom"] = hint->minzoom;
            if (hint->maxzoom)
                zoom["maxzoom"] = *hint->maxzoom;
            props["tippecanoe"] = std::move(zoom);
        }
        j["properties"] = std::move(props);
        j["geometry"] = f.geometry ? geometryToJson(*f.geometry) : boost::json::value(nullptr);
        return j;
    }

    boost::json::object aggregateToJson(Aggregate const &agg, int max_zoom) {
        boost::json::object props;
        props["cell"] = CellToString(agg.key.cell);
        props["res"] = agg.key.resolution;
        props["count"] = agg.count;
        props["frp_sum"] = Round3(agg.frp_sum);
        props["frp_max"] = Round3(agg.frp_max);
        props["frp_avg"] = Round3(agg.frpMean());
        props["fre_sum_mj"] = Round3(agg.fre_sum);
        props["fre_mean_mj"] = Round3(agg.freMean());
        props["last_time"] = agg.last_time ? boost::json::value(*agg.last_time) : boost::json::value(nullptr);
        // One aggregate covers one UTC day, so the time range is the day itself.
        props["time_min"] = agg.day_label;
        props["time_max"] = agg.day_label;
        props["time_min_ts"] = agg.key.day_start;
        props["time_max_ts"] = agg.day_end;
        props["day_start_ts"] = agg.key.day_start;
        props["day_end_ts"] = agg.day_end;
        props["day_label"] = agg.day_label;
        props["fros_sum"] = Round3(agg.fros_sum);
        props["fros_max"] = Round3(agg.fros_max);
        auto fros_avg = agg.frosMean();
        props["fros_avg"] = fros_avg ? boost::json::value(Round3(*fros_avg)) : boost::json::value(nullptr);

        boost::json::object zoom;
        zoom["minzoom"] = 0;
        zoom["maxzoom"] = max_zoom;
        props["tippecanoe"] = std::move(zoom);

        boost::json::object j;
        j["type"] = "Feature";
        j["properties"] = std::move(props);
        j["geometry"] = geometryToJson(Polygon{{CellBoundaryRing(agg.key.cell)}});
        return j;
    }

} // namespace hexfire
