#pragma once

#include "hexfire/types.hpp"

#include <boost/json/value.hpp>
#include <filesystem>

namespace hexfire {

    namespace op {
        // Reads a GeoJSON document and returns it as a FeatureCollection object.
        // A lone Feature or bare geometry is wrapped.
        boost::json::value ReadDocument(const std::filesystem::path &file);
    } // namespace op

    std::optional<Geometry> parseGeometry(const boost::json::value &geom);

    FireProperties parseProperties(const boost::json::value &props);

    // Decimal text of a double: 7.0, 0.25, 1e-05, 1e+16.
    std::string FormatDouble(double d);

    // Text form of a scalar JSON value: strings unquoted, integers in decimal, doubles through
    // FormatDouble, booleans as True/False. Empty on null, arrays and objects.
    std::optional<std::string> scalarText(const boost::json::value &v);

    FeatureCollection ReadFeatureCollection(const std::filesystem::path &file);

} // namespace hexfire
