#include <doctest/doctest.h>

#include "hexfire/aggregator.hpp"

#include <stdexcept>

using namespace hexfire;

namespace {

    Feature MakeObservation(const std::string &id, double lon, double lat, const std::string &time,
                        std::optional<double> frp, std::optional<double> fros = std::nullopt) {
        Feature f;
        f.geometry = Point{Position{lon, lat, {}}};
        f.properties.id_fire_event = id;
        f.properties.time = time;
        f.properties.frp = frp;
        f.properties.fros = fros;
        return f;
    }

    const Aggregate &OnlyBucket(const SpatialAggregator &agg) {
        REQUIRE(agg.size() == 1);
        return agg.table().begin()->second;
    }

} // namespace

TEST_CASE("Aggregator - Representative coordinate") {
    SUBCASE("Point is itself") {
        auto c = RepresentativeCoordinate(Point{Position{3.0, 4.0, {9.0}}});
        REQUIRE(c.has_value());
        CHECK(c->x == 3.0);
        CHECK(c->y == 4.0);
    }

    SUBCASE("LineString is the mean of its vertices") {
        auto c = RepresentativeCoordinate(LineString{{{0, 0, {}}, {2, 0, {}}, {4, 6, {}}}});
        REQUIRE(c.has_value());
        CHECK(c->x == doctest::Approx(2.0));
        CHECK(c->y == doctest::Approx(2.0));
    }

    SUBCASE("Polygon counts the closing vertex") {
        Polygon poly;
        poly.rings.push_back({{0, 0, {}}, {4, 0, {}}, {4, 4, {}}, {0, 0, {}}});
        auto c = RepresentativeCoordinate(poly);
        REQUIRE(c.has_value());
        CHECK(c->x == doctest::Approx(2.0));
        CHECK(c->y == doctest::Approx(1.0));
    }

    SUBCASE("Empty geometry has none") {
        CHECK_FALSE(RepresentativeCoordinate(MultiPoint{}).has_value());
        CHECK_FALSE(RepresentativeCoordinate(Polygon{}).has_value());
    }
}

TEST_CASE("Aggregator - FROS sentinel") {
    CHECK_FALSE(NormalizeFros(-999.0).has_value());
    CHECK_FALSE(NormalizeFros(-900.0).has_value());
    CHECK(NormalizeFros(-899.0) == -899.0);
    CHECK(NormalizeFros(0.5) == 0.5);
    CHECK_FALSE(NormalizeFros(std::nullopt).has_value());
}

TEST_CASE("Aggregator - Resolution is checked") {
    CHECK_THROWS_AS(SpatialAggregator(16), std::invalid_argument);
    CHECK_THROWS_AS(SpatialAggregator(-1), std::invalid_argument);
    CHECK(SpatialAggregator(0).resolution() == 0);
}

TEST_CASE("Aggregator - Dedup per entity") {
    SpatialAggregator agg(4);

    SUBCASE("Repeat observations of one entity count once but raise the maximum") {
        CHECK(agg.add(MakeObservation("F1", 10.0, 50.0, "2024-07-01T10:00:00Z", 10.0)));
        CHECK(agg.add(MakeObservation("F1", 10.0, 50.0, "2024-07-01T11:00:00Z", 30.0)));

        auto const &a = OnlyBucket(agg);
        CHECK(a.count == 1);
        CHECK(a.frp_sum == doctest::Approx(10.0));
        CHECK(a.frp_max == doctest::Approx(30.0));
        CHECK(a.fre_sum == doctest::Approx(a.frp_sum * 600.0));
        CHECK(a.fre_sum == doctest::Approx(6000.0));
        CHECK(a.last_time == std::optional<std::string>("2024-07-01T11:00:00Z"));
        CHECK(a.day_label == "2024-07-01");
        CHECK(a.key.day_start == 1719792000);
        CHECK(a.day_end == 1719792000 + 86400);
        CHECK(a.key.resolution == 4);
        CHECK(a.key.cell == *CellAt(50.0, 10.0, 4));
    }

    SUBCASE("Distinct entities are each counted") {
        agg.add(MakeObservation("F1", 10.0, 50.0, "2024-07-01T10:00:00Z", 10.0));
        agg.add(MakeObservation("F2", 10.0, 50.0, "2024-07-01T12:00:00Z", 20.0));

        auto const &a = OnlyBucket(agg);
        CHECK(a.count == 2);
        CHECK(a.frp_sum == doctest::Approx(30.0));
        CHECK(a.frpMean() == doctest::Approx(15.0));
        CHECK(a.freMean() == doctest::Approx(9000.0));
        CHECK(a.entity_ids.size() == 2);
    }

    SUBCASE("Other days and other cells are separate buckets") {
        agg.add(MakeObservation("F1", 10.0, 50.0, "2024-07-01T10:00:00Z", 10.0));
        agg.add(MakeObservation("F1", 10.0, 50.0, "2024-07-02T10:00:00Z", 10.0));
        agg.add(MakeObservation("F1", -70.0, -20.0, "2024-07-01T10:00:00Z", 10.0));
        CHECK(agg.size() == 3);
        for (auto const &entry : agg.table())
            CHECK(entry.second.count == 1);
    }
}

TEST_CASE("Aggregator - FROS statistics") {
    SpatialAggregator agg(3);

    SUBCASE("Sentinel never contributes") {
        agg.add(MakeObservation("F1", 10.0, 50.0, "2024-07-01T10:00:00Z", 5.0, -999.0));
        auto const &a = OnlyBucket(agg);
        CHECK(a.fros_count == 0);
        CHECK(a.fros_sum == 0.0);
        CHECK(a.fros_max == 0.0);
        CHECK_FALSE(a.frosMean().has_value());
    }

    SUBCASE("Valid values mix with the sentinel") {
        agg.add(MakeObservation("F1", 10.0, 50.0, "2024-07-01T10:00:00Z", 5.0, -999.0));
        agg.add(MakeObservation("F2", 10.0, 50.0, "2024-07-01T10:00:00Z", 5.0, 2.0));
        agg.add(MakeObservation("F3", 10.0, 50.0, "2024-07-01T10:00:00Z", 5.0, 4.0));
        auto const &a = OnlyBucket(agg);
        CHECK(a.count == 3);
        CHECK(a.fros_count == 2);
        CHECK(a.fros_sum == doctest::Approx(6.0));
        CHECK(a.fros_max == doctest::Approx(4.0));
        REQUIRE(a.frosMean().has_value());
        CHECK(*a.frosMean() == doctest::Approx(3.0));
    }

    SUBCASE("Maximum sees repeats of a counted entity") {
        agg.add(MakeObservation("F1", 10.0, 50.0, "2024-07-01T10:00:00Z", 5.0, 1.0));
        agg.add(MakeObservation("F1", 10.0, 50.0, "2024-07-01T10:10:00Z", 5.0, 7.0));
        auto const &a = OnlyBucket(agg);
        CHECK(a.fros_count == 1);
        CHECK(a.fros_sum == doctest::Approx(1.0));
        CHECK(a.fros_max == doctest::Approx(7.0));
    }
}

TEST_CASE("Aggregator - Ineligible features") {
    SpatialAggregator agg(3);

    auto no_id = MakeObservation("F1", 10.0, 50.0, "2024-07-01T10:00:00Z", 1.0);
    no_id.properties.id_fire_event.reset();
    CHECK_FALSE(agg.add(no_id));

    CHECK_FALSE(agg.add(MakeObservation("F1", 10.0, 50.0, "someday", 1.0)));

    auto bad_frp = MakeObservation("F1", 10.0, 50.0, "2024-07-01T10:00:00Z", std::nullopt);
    bad_frp.properties.invalid_frp = true;
    CHECK_FALSE(agg.add(bad_frp));

    auto empty = MakeObservation("F1", 10.0, 50.0, "2024-07-01T10:00:00Z", 1.0);
    empty.geometry = LineString{};
    CHECK_FALSE(agg.add(empty));

    auto no_geom = MakeObservation("F1", 10.0, 50.0, "2024-07-01T10:00:00Z", 1.0);
    no_geom.geometry.reset();
    CHECK_FALSE(agg.add(no_geom));

    CHECK(agg.size() == 0);

    SUBCASE("Missing FRP counts as zero") {
        CHECK(agg.add(MakeObservation("F9", 10.0, 50.0, "2024-07-01T10:00:00Z", std::nullopt)));
        auto const &a = OnlyBucket(agg);
        CHECK(a.count == 1);
        CHECK(a.frp_sum == 0.0);
    }
}

TEST_CASE("Aggregator - Release empties the table") {
    SpatialAggregator agg(2);
    agg.add(MakeObservation("F1", 10.0, 50.0, "2024-07-01T10:00:00Z", 1.0));
    auto table = agg.release();
    CHECK(table.size() == 1);
    CHECK(agg.size() == 0);
}
