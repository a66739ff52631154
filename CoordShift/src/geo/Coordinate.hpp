#pragma once

#include <string_view>
#include <type_traits>

namespace coordshift::geo {

// 坐标系标签（仅用于编译期区分，不占用存储）
struct Wgs84 {
    static constexpr std::string_view name{"wgs84"};
};

struct Gcj02 {
    static constexpr std::string_view name{"gcj02"};
};

struct Bd09 {
    static constexpr std::string_view name{"bd09"};
};

template<typename Tag>
inline constexpr bool is_datum_v = std::is_same_v<Tag, Wgs84> ||
                                   std::is_same_v<Tag, Gcj02> ||
                                   std::is_same_v<Tag, Bd09>;

// 未打标签的经纬度，用于运行时才知道坐标系的场合
struct LatLon {
    double lat{0.0};
    double lon{0.0};
};

// 经纬度差值（度）
struct CoordDelta {
    double dLat{0.0};
    double dLon{0.0};
};

// 带坐标系标签的经纬度坐标，不同坐标系之间不能隐式混用
template<typename Tag>
struct Coordinate {
    static_assert(is_datum_v<Tag>, "Coordinate requires a datum tag (Wgs84, Gcj02, Bd09)");

    using datum_type = Tag;

    double lat{0.0};
    double lon{0.0};

    constexpr Coordinate() = default;
    constexpr Coordinate(double lat, double lon) : lat(lat), lon(lon) {}

    constexpr CoordDelta operator-(const Coordinate& other) const noexcept {
        return CoordDelta{lat - other.lat, lon - other.lon};
    }

    constexpr Coordinate operator-(const CoordDelta& delta) const noexcept {
        return Coordinate{lat - delta.dLat, lon - delta.dLon};
    }

    constexpr bool operator==(const Coordinate&) const = default;
};

using WgsCoord = Coordinate<Wgs84>;
using GcjCoord = Coordinate<Gcj02>;
using BdCoord = Coordinate<Bd09>;

// 百度墨卡托平面坐标（BD09MC，米）
struct MercatorPoint {
    double x{0.0};
    double y{0.0};

    constexpr MercatorPoint() = default;
    constexpr MercatorPoint(double x, double y) : x(x), y(y) {}

    constexpr bool operator==(const MercatorPoint&) const = default;
};

} // namespace coordshift::geo
