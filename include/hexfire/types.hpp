#pragma once

#include <datapod/datapod.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dp = ::datapod;

namespace hexfire {

    // One coordinate tuple. x/y hold longitude/latitude once normalized; before that they hold
    // whatever the source frame declares. Trailing dimensions are carried but never transformed.
    struct Position {
        double x = 0.0;
        double y = 0.0;
        std::vector<double> extra;
    };

    using Ring = std::vector<Position>;

    struct Point {
        Position position;
    };

    struct MultiPoint {
        std::vector<Position> positions;
    };

    struct LineString {
        std::vector<Position> positions;
    };

    struct MultiLineString {
        std::vector<std::vector<Position>> lines;
    };

    struct Polygon {
        std::vector<Ring> rings;
    };

    struct MultiPolygon {
        std::vector<Polygon> polygons;
    };

    // Nesting depth is bounded by the alternatives: MultiPolygon -> Polygon -> Ring -> Position.
    using Geometry = std::variant<Point, MultiPoint, LineString, MultiLineString, Polygon, MultiPolygon>;

    // Allow-listed feature properties. Anything not named here is dropped on read.
    struct FireProperties {
        std::optional<std::string> id_fire_event;
        std::optional<double> frp;
        std::optional<double> fros;
        std::optional<double> duration;

        std::optional<std::string> time;
        std::optional<std::string> time_floor;
        std::optional<std::string> timestamp;
        std::optional<double> time_ts;

        std::optional<std::string> time_min;
        std::optional<std::string> time_max;
        std::optional<double> time_min_ts;
        std::optional<double> time_max_ts;

        std::optional<std::int64_t> day_start_ts;
        std::optional<std::int64_t> day_end_ts;

        // id_fire_event key was present, even when its value was unusable. A file-derived id
        // never replaces a declared one.
        bool id_declared = false;

        // frp was present but not a number. A bad fros or duration is simply treated as missing.
        bool invalid_frp = false;
    };

    struct Feature {
        std::optional<Geometry> geometry;
        FireProperties properties;
    };

    struct FeatureCollection {
        std::optional<std::string> crs_name;
        std::optional<dp::Geo> datum; // origin of a local ENU frame, when declared
        std::vector<Feature> features;
    };

} // namespace hexfire
