#include <catch2/catch_test_macros.hpp>
#include "../src/geo/ChinaBounds.hpp"

using namespace coordshift::geo;

TEST_CASE("China bounds rectangle", "[china]") {
    SECTION("Interior points") {
        REQUIRE(sanityInChina(WgsCoord{39.9042, 116.4074}));  // 北京
        REQUIRE(sanityInChina(WgsCoord{31.2304, 121.4737}));  // 上海
        REQUIRE(sanityInChina(WgsCoord{1.0, 110.0}));
    }

    SECTION("South edge") {
        REQUIRE(sanityInChina(WgsCoord{0.8293, 110.0}));
        REQUIRE_FALSE(sanityInChina(WgsCoord{0.8292, 110.0}));
        REQUIRE_FALSE(sanityInChina(WgsCoord{0.5, 110.0}));
    }

    SECTION("North edge") {
        REQUIRE(sanityInChina(WgsCoord{55.8271, 110.0}));
        REQUIRE_FALSE(sanityInChina(WgsCoord{55.8272, 110.0}));
    }

    SECTION("West edge") {
        REQUIRE(sanityInChina(WgsCoord{30.0, 72.004}));
        REQUIRE_FALSE(sanityInChina(WgsCoord{30.0, 72.0039}));
    }

    SECTION("East edge") {
        REQUIRE(sanityInChina(WgsCoord{30.0, 137.8347}));
        REQUIRE_FALSE(sanityInChina(WgsCoord{30.0, 137.8348}));
    }

    SECTION("Far away") {
        REQUIRE_FALSE(sanityInChina(WgsCoord{40.7128, -74.0060}));  // 纽约
        REQUIRE_FALSE(sanityInChina(WgsCoord{-33.8688, 151.2093})); // 悉尼
    }
}

TEST_CASE("China bounds works for every datum", "[china]") {
    STATIC_REQUIRE(sanityInChina(GcjCoord{30.0, 110.0}));
    STATIC_REQUIRE(sanityInChina(BdCoord{30.0, 110.0}));
    STATIC_REQUIRE_FALSE(sanityInChina(BdCoord{60.0, 110.0}));

    REQUIRE(kChinaBounds.minLon == 72.004);
    REQUIRE(kChinaBounds.minLat == 0.8293);
    REQUIRE(kChinaBounds.maxLon == 137.8347);
    REQUIRE(kChinaBounds.maxLat == 55.8271);
}
