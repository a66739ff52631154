#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "../src/geo/CoordFormat.hpp"
#include <cmath>

using namespace coordshift::geo;

TEST_CASE("Coordinate rounding", "[format]") {
    SECTION("Default precision") {
        auto rounded = format(GcjCoord{39.90875523135851, 116.3974611209652});
        REQUIRE(rounded.lat == Catch::Approx(39.908755).margin(1e-12));
        REQUIRE(rounded.lon == Catch::Approx(116.397461).margin(1e-12));
    }

    SECTION("Custom precision") {
        auto rounded = format(WgsCoord{39.90875523135851, 116.3974611209652}, 2);
        REQUIRE(rounded.lat == Catch::Approx(39.91).margin(1e-12));
        REQUIRE(rounded.lon == Catch::Approx(116.40).margin(1e-12));
    }

    SECTION("Half away from zero") {
        REQUIRE(roundTo(2.5, 0) == 3.0);
        REQUIRE(roundTo(-2.5, 0) == -3.0);
        REQUIRE(roundTo(0.125, 2) == Catch::Approx(0.13));
    }

    SECTION("Half-way decimals round on the decimal value") {
        // 1.005 * 100 在二进制下是 100.49999999999999
        REQUIRE(roundTo(1.005, 2) == 1.01);
        REQUIRE(roundTo(2.675, 2) == 2.68);
        REQUIRE(roundTo(-1.005, 2) == -1.01);
        REQUIRE(roundTo(39.9087555, 6) == 39.908756);
    }

    SECTION("Rounding to zero drops the sign") {
        REQUIRE(roundTo(-0.001, 2) == 0.0);
        REQUIRE_FALSE(std::signbit(roundTo(-0.001, 2)));
    }

    SECTION("Large values and long precision are unchanged") {
        REQUIRE(roundTo(1.0e308, 20) == 1.0e308);
        REQUIRE(roundTo(5.0e-324, 400) == 5.0e-324);
        REQUIRE(roundTo(0.1, 30) == 0.1);
    }
}

TEST_CASE("Coordinate fingerprint", "[format][hash]") {
    const WgsCoord point{39.1234, 116.5678};

    SECTION("Deterministic") {
        REQUIRE(hash(point) == hash(point));
        REQUIRE(hash(point) == 2535056763u);
    }

    SECTION("Sensitive to small changes") {
        REQUIRE(hash(point) != hash(WgsCoord{39.1235, 116.5678}));
        REQUIRE(hash(WgsCoord{39.1235, 116.5678}) == 2521069837u);
    }

    SECTION("Order matters") {
        REQUIRE(hashLatLon(39.1234, 116.5678) != hashLatLon(116.5678, 39.1234));
    }

    SECTION("Signed zero hashes the same") {
        REQUIRE(hashLatLon(0.0, 0.0) == hashLatLon(-0.0, 0.0));
        REQUIRE(hashLatLon(0.0, 0.0) == 1768495365u);
    }
}

TEST_CASE("Coordinate text", "[format]") {
    REQUIRE(toString(WgsCoord{39.9042, 116.4074}) == "39.904200,116.407400");
    REQUIRE(toString(BdCoord{-33.8688, -70.0}, 2) == "-33.87,-70.00");
    REQUIRE(toString(39.9042, 116.4074, 0) == "40,116");
    REQUIRE(toString(1.005, 2.675, 2) == "1.01,2.68");
    REQUIRE(toString(0.125, -0.125, 2) == "0.13,-0.13");
}
