#pragma once

#include "Coordinate.hpp"

namespace coordshift::geo {

// 经纬度包围盒（度）
struct GeoBBox {
    double minLon{0.0};
    double minLat{0.0};
    double maxLon{0.0};
    double maxLat{0.0};

    constexpr GeoBBox() = default;
    constexpr GeoBBox(double minLon, double minLat, double maxLon, double maxLat)
        : minLon(minLon), minLat(minLat), maxLon(maxLon), maxLat(maxLat) {}

    constexpr bool empty() const noexcept { return maxLon <= minLon || maxLat <= minLat; }

    // 闭区间判断，边界上的点视为在内
    constexpr bool contains(double lon, double lat) const noexcept {
        return lon >= minLon && lon <= maxLon && lat >= minLat && lat <= maxLat;
    }

    template<typename Tag>
    constexpr bool contains(const Coordinate<Tag>& coord) const noexcept {
        return contains(coord.lon, coord.lat);
    }
};

// 地球平均半径（米）
inline constexpr double kEarthMeanRadius = 6371000.0;

// Haversine 球面距离（米）
[[nodiscard]] double distanceMeters(double lat1, double lon1, double lat2, double lon2) noexcept;

// 同一坐标系下两点间距离
template<typename Tag>
[[nodiscard]] double distanceMeters(const Coordinate<Tag>& a, const Coordinate<Tag>& b) noexcept {
    return distanceMeters(a.lat, a.lon, b.lat, b.lon);
}

} // namespace coordshift::geo
