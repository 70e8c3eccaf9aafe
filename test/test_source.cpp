#include <doctest/doctest.h>

#include "fixtures.hpp"
#include "hexfire/source.hpp"

#include <stdexcept>

using namespace hexfire;

TEST_CASE("Source - Entity id from file name") {
    CHECK(EntityIdFromFileName("gdf_123.geojson") == std::optional<std::string>("123"));
    CHECK_FALSE(EntityIdFromFileName("gdf_12a.geojson").has_value());
    CHECK_FALSE(EntityIdFromFileName("xgdf_1.geojson").has_value());
    CHECK_FALSE(EntityIdFromFileName("gdf_1.json").has_value());
}

TEST_CASE("Source - Input directory checks") {
    CHECK_THROWS_AS(FeatureSource("/nonexistent/hexfire/input"), std::runtime_error);

    hexfire::test::TempDir dir("source_file");
    auto file = dir.write("plain.txt", "x");
    CHECK_THROWS_AS(FeatureSource{file}, std::runtime_error);
}

TEST_CASE("Source - Lexical order and skipping") {
    hexfire::test::TempDir dir("source_order");
    dir.write("b.geojson", test::PointCollection(test::PointFeature(2, 2, R"({"id_fire_event": "b"})")));
    dir.write("a.geojson", test::PointCollection(test::PointFeature(1, 1, R"({"id_fire_event": "a1"})") + "," +
                                                 test::PointFeature(1, 1, R"({"id_fire_event": "a2"})")));
    dir.write("c.geojson", "{ not json");
    dir.write("d.txt", test::PointCollection(test::PointFeature(4, 4, R"({"id_fire_event": "d"})")));
    std::filesystem::create_directory(dir.path() / "e.geojson");

    FeatureSource source(dir.path());
    CHECK(source.files().size() == 3);

    std::vector<std::string> ids;
    while (auto f = source.next())
        ids.push_back(f->properties.id_fire_event.value_or("?"));

    CHECK(ids == std::vector<std::string>{"a1", "a2", "b"});
    CHECK(source.filesRead() == 2);
    CHECK(source.filesSkipped() == 1);
    CHECK_FALSE(source.next().has_value());
}

TEST_CASE("Source - File-derived id and time range") {
    hexfire::test::TempDir dir("source_id");
    dir.write("gdf_42.geojson",
              test::PointCollection(test::PointFeature(1, 1, R"({"time": "2024-07-01T06:00:00Z", "frp": 1})") +
                                    "," + test::PointFeature(1, 1, R"({"time": "2024-07-02T18:00:00Z"})") + "," +
                                    test::PointFeature(1, 1, R"({"id_fire_event": "own"})")));

    FeatureSource source(dir.path());
    auto first = source.next();
    REQUIRE(first.has_value());
    CHECK(first->properties.id_fire_event == std::optional<std::string>("42"));
    CHECK(first->properties.time_min_ts == 1719813600.0);
    CHECK(first->properties.time_max_ts == 1719943200.0);
    CHECK(first->properties.time_min == std::optional<std::string>("2024-07-01T06:00:00Z"));
    CHECK(first->properties.time_max == std::optional<std::string>("2024-07-02T18:00:00Z"));

    auto second = source.next();
    REQUIRE(second.has_value());
    CHECK(second->properties.id_fire_event == std::optional<std::string>("42"));

    auto third = source.next();
    REQUIRE(third.has_value());
    CHECK(third->properties.id_fire_event == std::optional<std::string>("own"));
    CHECK_FALSE(third->properties.time_min_ts.has_value());
}

TEST_CASE("Source - Declared null id is not replaced") {
    hexfire::test::TempDir dir("source_null_id");
    dir.write("gdf_5.geojson",
              test::PointCollection(test::PointFeature(1, 1, R"({"id_fire_event": null, "time": "2024-07-01"})") +
                                    "," + test::PointFeature(1, 1, R"({"time": "2024-07-01"})")));

    FeatureSource source(dir.path());
    auto declared = source.next();
    REQUIRE(declared.has_value());
    CHECK(declared->properties.id_declared);
    CHECK_FALSE(declared->properties.id_fire_event.has_value());
    CHECK_FALSE(declared->properties.time_min_ts.has_value());

    auto undeclared = source.next();
    REQUIRE(undeclared.has_value());
    CHECK(undeclared->properties.id_fire_event == std::optional<std::string>("5"));
}

TEST_CASE("Source - Reprojection per file") {
    hexfire::test::TempDir dir("source_crs");
    dir.write("a.geojson", test::PointCollection(R"({"type": "Feature", "geometry": {"type": "Point",
        "coordinates": [1113194.9079327357, 6446275.841017158]}, "properties": {"id_fire_event": "m"}})",
                                                 "EPSG:3857"));
    dir.write("b.geojson", test::PointCollection(test::PointFeature(10.5, 50.5, R"({"id_fire_event": "g"})"),
                                                 "EPSG:4326"));
    dir.write("c.geojson", test::PointCollection(test::PointFeature(1, 1, R"({"id_fire_event": "bad"})"),
                                                 "EPSG:999999"));

    FeatureSource source(dir.path());
    auto m = source.next();
    REQUIRE(m.has_value());
    auto const &mp = std::get<Point>(*m->geometry).position;
    CHECK(mp.x == doctest::Approx(10.0).epsilon(1e-6));
    CHECK(mp.y == doctest::Approx(50.0).epsilon(1e-6));

    auto g = source.next();
    REQUIRE(g.has_value());
    auto const &gp = std::get<Point>(*g->geometry).position;
    CHECK(gp.x == 10.5);
    CHECK(gp.y == 50.5);

    CHECK_FALSE(source.next().has_value());
    CHECK(source.filesSkipped() == 1);
}
