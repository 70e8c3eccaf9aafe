#include "hexfire/parser.hpp"

#include "hexfire/log.hpp"

#include <boost/json.hpp>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace hexfire {

    namespace op {
        boost::json::value ReadDocument(const std::filesystem::path &file) {
            std::ifstream ifs(file);
            if (!ifs) {
                throw std::runtime_error("hexfire::ReadFeatureCollection(): cannot open \"" + file.string() + '\"');
            }

            std::stringstream buffer;
            buffer << ifs.rdbuf();
            boost::json::value j = boost::json::parse(buffer.str());

            if (!j.is_object() || !j.as_object().contains("type") || !j.as_object().at("type").is_string()) {
                throw std::runtime_error(
                    "hexfire::ReadFeatureCollection(): top-level object has no string 'type' field");
            }

            auto type = std::string(j.as_object().at("type").as_string());
            if (type == "FeatureCollection") {
                return j;
            }
            if (type == "Feature") {
                boost::json::object fc;
                fc["type"] = "FeatureCollection";
                boost::json::array features;
                features.push_back(j);
                fc["features"] = std::move(features);
                return fc;
            }

            boost::json::object feat;
            feat["type"] = "Feature";
            feat["geometry"] = j;
            feat["properties"] = boost::json::object();
            boost::json::object fc;
            fc["type"] = "FeatureCollection";
            boost::json::array features;
            features.push_back(std::move(feat));
            fc["features"] = std::move(features);
            return fc;
        }
    } // namespace op

    using json = boost::json::value;

    namespace {

        std::optional<Position> parsePosition(const json &coords) {
            auto const *arr = coords.if_array();
            if (!arr || arr->size() < 2)
                return std::nullopt;
            for (auto const &v : *arr) {
                if (!v.is_number())
                    return std::nullopt;
            }
            Position p;
            p.x = arr->at(0).to_number<double>();
            p.y = arr->at(1).to_number<double>();
            for (std::size_t i = 2; i < arr->size(); ++i)
                p.extra.push_back(arr->at(i).to_number<double>());
            return p;
        }

        std::vector<Position> parsePositions(const json &coords) {
            std::vector<Position> pts;
            auto const *arr = coords.if_array();
            if (!arr)
                return pts;
            pts.reserve(arr->size());
            for (auto const &c : *arr) {
                if (auto p = parsePosition(c))
                    pts.push_back(std::move(*p));
            }
            return pts;
        }

        Polygon parsePolygon(const json &coords) {
            Polygon poly;
            auto const *arr = coords.if_array();
            if (!arr)
                return poly;
            for (auto const &ring : *arr)
                poly.rings.push_back(parsePositions(ring));
            return poly;
        }

        // Numeric property: JSON numbers and numeric strings are accepted.
        void readNumber(const boost::json::object &obj, const char *key, std::optional<double> &out,
                        bool &invalid) {
            auto const *v = obj.if_contains(key);
            if (!v || v->is_null())
                return;
            if (v->is_number()) {
                out = v->to_number<double>();
                return;
            }
            if (v->is_string()) {
                std::string s(v->as_string());
                try {
                    std::size_t used = 0;
                    double d = std::stod(s, &used);
                    if (used == s.size() && std::isfinite(d)) {
                        out = d;
                        return;
                    }
                } catch (const std::logic_error &) {
                    // not a number, reported below
                }
            }
            invalid = true;
        }

        void readString(const boost::json::object &obj, const char *key, std::optional<std::string> &out) {
            auto const *v = obj.if_contains(key);
            if (v && v->is_string())
                out = std::string(v->as_string());
        }

        std::optional<std::string> readCrsName(const boost::json::object &doc) {
            if (auto const *crs = doc.if_contains("crs")) {
                if (crs->is_string())
                    return std::string(crs->as_string());
                if (auto const *c = crs->if_object()) {
                    if (auto const *p = c->if_contains("properties"); p && p->is_object()) {
                        if (auto const *name = p->as_object().if_contains("name"); name && name->is_string())
                            return std::string(name->as_string());
                    }
                    if (auto const *name = c->if_contains("name"); name && name->is_string())
                        return std::string(name->as_string());
                }
            }
            if (auto const *P = doc.if_contains("properties"); P && P->is_object()) {
                if (auto const *crs = P->as_object().if_contains("crs"); crs && crs->is_string())
                    return std::string(crs->as_string());
            }
            return std::nullopt;
        }

    } // namespace

    std::string FormatDouble(double d) {
        if (!std::isfinite(d))
            return std::isnan(d) ? "nan" : (d > 0 ? "inf" : "-inf");

        char buf[32];
        // Integral values below 1e16 keep one decimal (7.0); anything else takes the
        // shortest %g form that reads back to the same double (0.1, 1e-05, 1e+16).
        if (std::fabs(d) < 1e16 && std::trunc(d) == d) {
            std::snprintf(buf, sizeof(buf), "%.1f", d);
            return buf;
        }
        for (int precision = 1; precision <= 17; ++precision) {
            std::snprintf(buf, sizeof(buf), "%.*g", precision, d);
            if (std::strtod(buf, nullptr) == d)
                break;
        }
        return buf;
    }

    std::optional<std::string> scalarText(const json &v) {
        switch (v.kind()) {
        case boost::json::kind::string:
            return std::string(v.as_string());
        case boost::json::kind::int64:
            return std::to_string(v.as_int64());
        case boost::json::kind::uint64:
            return std::to_string(v.as_uint64());
        case boost::json::kind::double_:
            return FormatDouble(v.as_double());
        case boost::json::kind::bool_:
            return std::string(v.as_bool() ? "True" : "False");
        default:
            return std::nullopt;
        }
    }

    std::optional<Geometry> parseGeometry(const json &geom) {
        auto const *obj = geom.if_object();
        if (!obj)
            return std::nullopt;
        auto const *type_v = obj->if_contains("type");
        auto const *coords = obj->if_contains("coordinates");
        if (!type_v || !type_v->is_string() || !coords)
            return std::nullopt;

        auto type = std::string(type_v->as_string());
        if (type == "Point") {
            auto p = parsePosition(*coords);
            if (!p)
                return std::nullopt;
            return Geometry{Point{std::move(*p)}};
        } else if (type == "MultiPoint") {
            return Geometry{MultiPoint{parsePositions(*coords)}};
        } else if (type == "LineString") {
            return Geometry{LineString{parsePositions(*coords)}};
        } else if (type == "MultiLineString") {
            MultiLineString mls;
            if (auto const *arr = coords->if_array()) {
                for (auto const &line : *arr)
                    mls.lines.push_back(parsePositions(line));
            }
            return Geometry{std::move(mls)};
        } else if (type == "Polygon") {
            return Geometry{parsePolygon(*coords)};
        } else if (type == "MultiPolygon") {
            MultiPolygon mp;
            if (auto const *arr = coords->if_array()) {
                for (auto const &poly : *arr)
                    mp.polygons.push_back(parsePolygon(poly));
            }
            return Geometry{std::move(mp)};
        }
        log()->debug("dropping unsupported geometry type '{}'", type);
        return std::nullopt;
    }

    FireProperties parseProperties(const json &props) {
        FireProperties p;
        auto const *obj = props.if_object();
        if (!obj)
            return p;

        if (auto const *id = obj->if_contains("id_fire_event")) {
            p.id_declared = true;
            p.id_fire_event = scalarText(*id);
        }

        bool ignored = false;
        readNumber(*obj, "frp", p.frp, p.invalid_frp);
        readNumber(*obj, "fros", p.fros, ignored);
        readNumber(*obj, "duration", p.duration, ignored);

        readString(*obj, "time", p.time);
        readString(*obj, "time_floor", p.time_floor);
        readString(*obj, "timestamp", p.timestamp);
        readString(*obj, "time_min", p.time_min);
        readString(*obj, "time_max", p.time_max);

        // Derived fields from an earlier run are carried when present; bad values are dropped.
        readNumber(*obj, "time_ts", p.time_ts, ignored);
        readNumber(*obj, "time_min_ts", p.time_min_ts, ignored);
        readNumber(*obj, "time_max_ts", p.time_max_ts, ignored);
        std::optional<double> day;
        readNumber(*obj, "day_start_ts", day, ignored);
        if (day)
            p.day_start_ts = static_cast<std::int64_t>(*day);
        day.reset();
        readNumber(*obj, "day_end_ts", day, ignored);
        if (day)
            p.day_end_ts = static_cast<std::int64_t>(*day);

        return p;
    }

    FeatureCollection ReadFeatureCollection(const std::filesystem::path &file) {
        auto fc_json = op::ReadDocument(file);
        auto const &fc_obj = fc_json.as_object();

        FeatureCollection fc;
        fc.crs_name = readCrsName(fc_obj);

        if (fc.crs_name && (*fc.crs_name == "ENU" || *fc.crs_name == "ECEF")) {
            auto const *P = fc_obj.if_contains("properties");
            auto const *D = (P && P->is_object()) ? P->as_object().if_contains("datum") : nullptr;
            auto const *A = D ? D->if_array() : nullptr;
            if (!A || A->size() < 3 || !(*A)[0].is_number() || !(*A)[1].is_number() || !(*A)[2].is_number())
                throw std::runtime_error("'properties' missing array 'datum' of >=3 numbers");
            // GeoJSON order is [longitude, latitude, altitude]; dp::Geo is {latitude, longitude, altitude}
            fc.datum = dp::Geo{(*A)[1].to_number<double>(), (*A)[0].to_number<double>(),
                               (*A)[2].to_number<double>()};
        }

        auto const *features = fc_obj.if_contains("features");
        if (!features || features->is_null())
            return fc;
        if (!features->is_array())
            throw std::runtime_error("hexfire::ReadFeatureCollection(): 'features' is not an array");

        fc.features.reserve(features->as_array().size());
        for (auto const &feat : features->as_array()) {
            auto const *feat_obj = feat.if_object();
            if (!feat_obj)
                continue;
            Feature f;
            if (auto const *g = feat_obj->if_contains("geometry"); g && !g->is_null())
                f.geometry = parseGeometry(*g);
            if (auto const *props = feat_obj->if_contains("properties"))
                f.properties = parseProperties(*props);
            fc.features.push_back(std::move(f));
        }

        return fc;
    }

} // namespace hexfire
