#pragma once

#include "hexfire/types.hpp"

#include <memory>
#include <optional>
#include <string>

class OGRCoordinateTransformation;

namespace hexfire {

    constexpr int kGeographicEpsg = 4326;

    // Extracts n from "EPSG:n" / "EPSG::n" anywhere in the declaration. nullopt when absent.
    std::optional<int> ParseEpsgCode(const std::string &crs_name);

    // Maps one source-frame position to longitude/latitude degrees. Trailing dimensions pass through.
    class CoordinateTransform {
      public:
        virtual ~CoordinateTransform() = default;
        virtual Position apply(const Position &p) const = 0;
    };

    // EPSG:n -> EPSG:4326 in longitude-then-latitude order, backed by OGR.
    class EpsgTransform final : public CoordinateTransform {
      public:
        explicit EpsgTransform(int epsg);
        Position apply(const Position &p) const override;
        int epsg() const { return epsg_; }

      private:
        struct Deleter {
            void operator()(OGRCoordinateTransformation *ct) const;
        };
        int epsg_;
        std::unique_ptr<OGRCoordinateTransformation, Deleter> ct_;
    };

    // Local east/north/up metres around a datum -> WGS84.
    class EnuTransform final : public CoordinateTransform {
      public:
        explicit EnuTransform(const dp::Geo &datum) : datum_(datum) {}
        Position apply(const Position &p) const override;

      private:
        dp::Geo datum_;
    };

    // Builds the transformer a collection needs, or nullptr when it is already geographic
    // (no declaration, EPSG:4326, or an unrecognized declaration). Throws when an EPSG code
    // is declared that OGR cannot resolve.
    std::unique_ptr<CoordinateTransform> MakeTransform(const FeatureCollection &fc);

    Geometry TransformGeometry(const Geometry &geom, const CoordinateTransform &tf);

} // namespace hexfire
