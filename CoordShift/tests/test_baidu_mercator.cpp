#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/geo/BaiduMercator.hpp"

using namespace coordshift::geo;

TEST_CASE("Baidu Mercator forward projection", "[mercator]") {
    SECTION("Origin") {
        REQUIRE(llToMc(0.0, 0.0) == MercatorPoint{0.0, 0.0});
        REQUIRE(llToMc(BdCoord{0.0, 0.0}) == MercatorPoint{0.0, 0.0});
    }

    SECTION("Points next to the origin are not snapped") {
        auto mc = llToMc(0.001, 0.001);
        REQUIRE(mc.x == Catch::Approx(111.32).margin(0.01));
        REQUIRE(mc.y > 100.0);
    }

    SECTION("Beijing") {
        auto mc = llToMc(116.404, 39.915);
        REQUIRE(mc.x == Catch::Approx(12958175.00).margin(0.005));
        REQUIRE(mc.y == Catch::Approx(4825923.77).margin(0.005));
    }

    SECTION("Shanghai") {
        auto mc = llToMc(BdCoord{31.240, 121.499});
        REQUIRE(mc.x == Catch::Approx(13525353.98).margin(0.005));
        REQUIRE(mc.y == Catch::Approx(3641593.36).margin(0.005));
    }

    SECTION("Negative longitude") {
        auto mc = llToMc(-120.0, 35.0);
        REQUIRE(mc.x == Catch::Approx(-13358484.24).margin(0.005));
        REQUIRE(mc.y == Catch::Approx(4139145.66).margin(0.005));
    }

    SECTION("Southern hemisphere mirrors the north") {
        auto north = llToMc(-120.0, 35.0);
        auto south = llToMc(120.0, -35.0);
        REQUIRE(south.x == Catch::Approx(-north.x));
        REQUIRE(south.y == Catch::Approx(-north.y));
    }

    SECTION("Corner of the valid range") {
        auto mc = llToMc(180.0, 74.0);
        REQUIRE(mc.x == Catch::Approx(20037726.37).margin(0.005));
        REQUIRE(mc.y == Catch::Approx(12474104.17).margin(0.005));
    }

    SECTION("Latitude is clamped to 74") {
        REQUIRE(llToMc(100.0, 85.0) == llToMc(100.0, 74.0));
        REQUIRE(llToMc(100.0, -89.0) == llToMc(100.0, -74.0));
    }

    SECTION("Longitude wraps around") {
        auto wrapped = llToMc(-243.596, 39.915);
        auto plain = llToMc(116.404, 39.915);
        REQUIRE(wrapped.x == Catch::Approx(plain.x).margin(0.01));
        REQUIRE(wrapped.y == Catch::Approx(plain.y).margin(0.01));
    }
}

TEST_CASE("Baidu Mercator inverse projection", "[mercator]") {
    SECTION("Beijing") {
        auto ll = mcToLl(12958224.0, 4825923.0);
        REQUIRE(ll.lon == Catch::Approx(116.40444).margin(0.000005));
        REQUIRE(ll.lat == Catch::Approx(39.91499).margin(0.000005));
    }

    SECTION("Shanghai") {
        auto ll = mcToLl(MercatorPoint{13529134.0, 3661910.0});
        REQUIRE(ll.lon == Catch::Approx(121.53296).margin(0.000005));
        REQUIRE(ll.lat == Catch::Approx(31.39669).margin(0.000005));
    }

    SECTION("Negative quadrant") {
        auto ll = mcToLl(-13000000.0, -4000000.0);
        REQUIRE(ll.lon == Catch::Approx(-116.77972).margin(0.000005));
        REQUIRE(ll.lat == Catch::Approx(-33.96492).margin(0.000005));
    }

    SECTION("Corner of the valid range") {
        auto ll = mcToLl(llToMc(180.0, 74.0));
        REQUIRE(ll.lon == Catch::Approx(180.0).margin(0.05));
        REQUIRE(ll.lat == Catch::Approx(74.0).margin(0.05));
    }
}

TEST_CASE("Baidu Mercator round trip across latitude bands", "[mercator]") {
    const BdCoord cities[] = {
        {39.915, 116.404},  // 北京
        {31.230, 121.473},  // 上海
        {23.129, 113.264},  // 广州
        {43.826, 87.617},   // 乌鲁木齐
        {45.803, 126.535},  // 哈尔滨
        {-33.869, 151.209},
        {64.147, -21.943},
    };

    for (const auto& city : cities) {
        auto ll = mcToLl(llToMc(city));
        REQUIRE(ll.lat == Catch::Approx(city.lat).margin(0.0001));
        REQUIRE(ll.lon == Catch::Approx(city.lon).margin(0.0001));
    }
}
