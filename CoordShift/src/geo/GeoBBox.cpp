#define _USE_MATH_DEFINES
#include "geo/GeoBBox.hpp"
#include <algorithm>
#include <cmath>

namespace coordshift::geo {

namespace {
    // 角度转弧度
    constexpr double toRadians(double degrees) {
        return degrees * M_PI / 180.0;
    }

    // 半正矢
    double haversine(double theta) {
        return std::pow(std::sin(theta / 2), 2);
    }
}

double distanceMeters(double lat1, double lon1, double lat2, double lon2) noexcept {
    const double lat1Rad = toRadians(lat1);
    const double lat2Rad = toRadians(lat2);
    const double deltaLat = toRadians(lat1 - lat2);
    const double deltaLon = toRadians(lon1 - lon2);

    const double a = haversine(deltaLat) +
                     std::cos(lat1Rad) * std::cos(lat2Rad) * haversine(deltaLon);

    // 对跖点附近 a 可能因舍入略大于 1
    return 2 * kEarthMeanRadius * std::asin(std::sqrt(std::min(a, 1.0)));
}

} // namespace coordshift::geo
