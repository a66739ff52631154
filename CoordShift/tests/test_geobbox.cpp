#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/geo/GeoBBox.hpp"

using namespace coordshift::geo;

TEST_CASE("GeoBBox contains", "[geobbox]") {
    GeoBBox bbox(100.0, 30.0, 120.0, 50.0);

    SECTION("Contains point") {
        REQUIRE(bbox.contains(110.0, 40.0));
        REQUIRE(bbox.contains(100.0, 30.0));  // 边界点
        REQUIRE(bbox.contains(120.0, 50.0));  // 边界点
        REQUIRE_FALSE(bbox.contains(90.0, 40.0));
        REQUIRE_FALSE(bbox.contains(110.0, 60.0));
    }

    SECTION("Contains coordinate") {
        // Coordinate 是 (lat, lon) 顺序
        REQUIRE(bbox.contains(WgsCoord{40.0, 110.0}));
        REQUIRE_FALSE(bbox.contains(WgsCoord{110.0, 40.0}));
    }

    SECTION("Empty box") {
        REQUIRE_FALSE(bbox.empty());
        REQUIRE(GeoBBox{}.empty());
        // 经度或纬度方向退化为一条线
        REQUIRE(GeoBBox(100.0, 30.0, 100.0, 50.0).empty());
        REQUIRE(GeoBBox(100.0, 50.0, 120.0, 30.0).empty());
    }
}

TEST_CASE("Haversine distance", "[geobbox][distance]") {
    const WgsCoord beijing{39.9042, 116.4074};
    const WgsCoord shanghai{31.2304, 121.4737};

    SECTION("Same point") {
        REQUIRE(distanceMeters(beijing, beijing) == 0.0);
        REQUIRE(distanceMeters(0.0, 0.0, 0.0, 0.0) == 0.0);
    }

    SECTION("Beijing to Shanghai") {
        const double d = distanceMeters(beijing, shanghai);
        REQUIRE(d == Catch::Approx(1067310.17).margin(1.0));
        REQUIRE(d > 966000.0);
        REQUIRE(d < 1166000.0);
    }

    SECTION("Symmetric") {
        REQUIRE(distanceMeters(beijing, shanghai) == Catch::Approx(distanceMeters(shanghai, beijing)));
    }

    SECTION("One degree of latitude") {
        REQUIRE(distanceMeters(0.0, 0.0, 1.0, 0.0) == Catch::Approx(111194.93).margin(0.01));
    }

    SECTION("Antipodal points") {
        REQUIRE(distanceMeters(0.0, 0.0, 0.0, 180.0) == Catch::Approx(20015086.80).margin(0.01));
    }
}
