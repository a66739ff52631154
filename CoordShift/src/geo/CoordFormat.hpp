#pragma once

#include "Coordinate.hpp"
#include <cstdint>
#include <string>

namespace coordshift::geo {

inline constexpr int kDefaultPrecision = 6;

// 四舍五入到指定小数位（远离零方向），按 value 的最短十进制表示舍入：
// roundTo(1.005, 2) == 1.01
[[nodiscard]] double roundTo(double value, int precision);

// 坐标格式化：经纬度分别保留 precision 位小数
template<typename Tag>
[[nodiscard]] Coordinate<Tag> format(const Coordinate<Tag>& coord, int precision = kDefaultPrecision) {
    return Coordinate<Tag>{roundTo(coord.lat, precision), roundTo(coord.lon, precision)};
}

// 32 位坐标指纹（FNV-1a），跨进程、跨平台稳定，可作为合成的位置标识
[[nodiscard]] std::uint32_t hashLatLon(double lat, double lon) noexcept;

template<typename Tag>
[[nodiscard]] std::uint32_t hash(const Coordinate<Tag>& coord) noexcept {
    return hashLatLon(coord.lat, coord.lon);
}

// "lat,lon" 文本，先经 roundTo 舍入再按 precision 位小数输出
[[nodiscard]] std::string toString(double lat, double lon, int precision = kDefaultPrecision);

template<typename Tag>
[[nodiscard]] std::string toString(const Coordinate<Tag>& coord, int precision = kDefaultPrecision) {
    return toString(coord.lat, coord.lon, precision);
}

} // namespace coordshift::geo
