#pragma once

#include "hexfire/aggregator.hpp"
#include "hexfire/types.hpp"

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>
#include <optional>

namespace hexfire {

    // Tile-builder zoom hint, written as the "tippecanoe" property object.
    struct ZoomHint {
        int minzoom = 0;
        std::optional<int> maxzoom;
    };

    // Emitted sums, means and maxima carry three decimals; accumulation never rounds.
    double Round3(double v);

    boost::json::value geometryToJson(Geometry const &geom);

    // Only populated fields are written.
    boost::json::object propertiesToJson(FireProperties const &props);

    boost::json::object featureToJson(Feature const &f, std::optional<ZoomHint> const &hint);

    // Hexagon polygon feature carrying the bucket's statistics, shown from zoom 0 to max_zoom.
    boost::json::object aggregateToJson(Aggregate const &agg, int max_zoom);

} // namespace hexfire
