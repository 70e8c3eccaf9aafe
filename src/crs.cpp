#include "hexfire/crs.hpp"

#include <concord/concord.hpp>
#include <ogr_spatialref.h>

#include <regex>
#include <stdexcept>
#include <type_traits>

namespace hexfire {

    std::optional<int> ParseEpsgCode(const std::string &crs_name) {
        static const std::regex kEpsg(R"(EPSG::?(\d+))");
        std::smatch m;
        if (!std::regex_search(crs_name, m, kEpsg))
            return std::nullopt;
        try {
            return std::stoi(m[1].str());
        } catch (const std::out_of_range &) {
            return std::nullopt;
        }
    }

    void EpsgTransform::Deleter::operator()(OGRCoordinateTransformation *ct) const {
        if (ct)
            OGRCoordinateTransformation::DestroyCT(ct);
    }

    EpsgTransform::EpsgTransform(int epsg) : epsg_(epsg) {
        OGRSpatialReference src;
        if (src.importFromEPSG(epsg) != OGRERR_NONE)
            throw std::runtime_error("unknown reference system EPSG:" + std::to_string(epsg));
        src.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

        OGRSpatialReference dst;
        if (dst.importFromEPSG(kGeographicEpsg) != OGRERR_NONE)
            throw std::runtime_error("cannot load EPSG:4326 definition");
        dst.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);

        ct_.reset(OGRCreateCoordinateTransformation(&src, &dst));
        if (!ct_)
            throw std::runtime_error("no transformation from EPSG:" + std::to_string(epsg) + " to EPSG:4326");
    }

    Position EpsgTransform::apply(const Position &p) const {
        double x = p.x;
        double y = p.y;
        if (!ct_->Transform(1, &x, &y))
            throw std::runtime_error("EPSG:" + std::to_string(epsg_) + " coordinate out of domain");
        return Position{x, y, p.extra};
    }

    Position EnuTransform::apply(const Position &p) const {
        const double up = p.extra.empty() ? 0.0 : p.extra.front();
        concord::frame::ENU enu{dp::Point{p.x, p.y, up}, datum_};
        auto wgs = concord::frame::to_wgs(enu);
        return Position{wgs.longitude, wgs.latitude, p.extra};
    }

    std::unique_ptr<CoordinateTransform> MakeTransform(const FeatureCollection &fc) {
        if (!fc.crs_name)
            return nullptr;
        if (fc.datum && (*fc.crs_name == "ENU" || *fc.crs_name == "ECEF"))
            return std::make_unique<EnuTransform>(*fc.datum);
        auto code = ParseEpsgCode(*fc.crs_name);
        if (!code || *code == kGeographicEpsg)
            return nullptr;
        return std::make_unique<EpsgTransform>(*code);
    }

    namespace {

        std::vector<Position> transformAll(const std::vector<Position> &pts, const CoordinateTransform &tf) {
            std::vector<Position> out;
            out.reserve(pts.size());
            for (auto const &p : pts)
                out.push_back(tf.apply(p));
            return out;
        }

        Polygon transformPolygon(const Polygon &poly, const CoordinateTransform &tf) {
            Polygon out;
            out.rings.reserve(poly.rings.size());
            for (auto const &ring : poly.rings)
                out.rings.push_back(transformAll(ring, tf));
            return out;
        }

    } // namespace

    Geometry TransformGeometry(const Geometry &geom, const CoordinateTransform &tf) {
        return std::visit(
            [&](auto const &shape) -> Geometry {
                using T = std::decay_t<decltype(shape)>;
                if constexpr (std::is_same_v<T, Point>) {
                    return Point{tf.apply(shape.position)};
                } else if constexpr (std::is_same_v<T, MultiPoint>) {
                    return MultiPoint{transformAll(shape.positions, tf)};
                } else if constexpr (std::is_same_v<T, LineString>) {
                    return LineString{transformAll(shape.positions, tf)};
                } else if constexpr (std::is_same_v<T, MultiLineString>) {
                    MultiLineString out;
                    for (auto const &line : shape.lines)
                        out.lines.push_back(transformAll(line, tf));
                    return out;
                } else if constexpr (std::is_same_v<T, Polygon>) {
                    return transformPolygon(shape, tf);
                } else {
                    MultiPolygon out;
                    for (auto const &poly : shape.polygons)
                        out.polygons.push_back(transformPolygon(poly, tf));
                    return out;
                }
            },
            geom);
    }

} // namespace hexfire
