#pragma once

#include "../geo/Coordinate.hpp"
#include "../geo/GeoBBox.hpp"
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace coordshift::tile {

// 瓦片大小（像素）
inline constexpr int kTileSize = 256;

// 百度瓦片分辨率的基准级别
inline constexpr int kBaiduBaseZoom = 18;

// 瓦片编号的绝对值上限，更大的结果截断到该值
inline constexpr std::int64_t kMaxTileIndex = std::int64_t{1} << 62;

// 瓦片坐标 (zoom, x, y)
struct TileAddress {
    int zoom{0};
    std::int64_t x{0};
    std::int64_t y{0};

    constexpr TileAddress() = default;
    constexpr TileAddress(int zoom, std::int64_t x, std::int64_t y) : zoom(zoom), x(x), y(y) {}

    // 标准瓦片金字塔范围内：0 <= x, y < 2^zoom
    constexpr bool inPyramid() const noexcept {
        if (zoom < 0 || zoom > 62) {
            return false;
        }
        const std::int64_t n = std::int64_t{1} << zoom;
        return x >= 0 && x < n && y >= 0 && y < n;
    }

    constexpr bool operator==(const TileAddress&) const = default;
};

enum class TileParseError {
    InvalidFormat,
    InvalidZoom
};

// 解析 "z/x/y" 形式的瓦片坐标
[[nodiscard]] std::expected<TileAddress, TileParseError> parseTileAddress(std::string_view text);

[[nodiscard]] std::string toString(const TileAddress& tile);

// ---- 标准 Web 墨卡托瓦片 ----

[[nodiscard]] TileAddress coordToTile(int zoom, double lat, double lon) noexcept;

// GCJ-02 与 WGS-84 共用同一套瓦片网格，任意坐标系都可以直接换算
template<typename Tag>
[[nodiscard]] TileAddress coordToTile(int zoom, const geo::Coordinate<Tag>& coord) noexcept {
    return coordToTile(zoom, coord.lat, coord.lon);
}

[[nodiscard]] geo::LatLon tileToLatLon(int zoom, std::int64_t x, std::int64_t y) noexcept;

// 瓦片西北角的经纬度
template<typename Tag = geo::Wgs84>
[[nodiscard]] geo::Coordinate<Tag> tileToCoord(int zoom, std::int64_t x, std::int64_t y) noexcept {
    const auto corner = tileToLatLon(zoom, x, y);
    return geo::Coordinate<Tag>{corner.lat, corner.lon};
}

// 瓦片覆盖的经纬度范围
[[nodiscard]] geo::GeoBBox tileToBbox(int zoom, std::int64_t x, std::int64_t y) noexcept;

// 标准 y 与 TMS y 互换（行序上下翻转）
[[nodiscard]] std::int64_t tmsConvertY(int zoom, std::int64_t y) noexcept;

// ---- 坐标系之间的瓦片换算 ----

// GCJ-02 与 WGS-84 瓦片编号相同，只是图像内容不同
[[nodiscard]] TileAddress wgsToGcj(const TileAddress& tile) noexcept;
[[nodiscard]] TileAddress gcjToWgs(const TileAddress& tile) noexcept;

// 标准瓦片 -> 百度瓦片，只换投影，不做坐标系偏移
[[nodiscard]] TileAddress wgsToBd(const TileAddress& tile) noexcept;

// 百度瓦片 -> 标准瓦片，同样只换投影
[[nodiscard]] TileAddress bdToWgs(const TileAddress& tile) noexcept;

// ---- 百度瓦片 ----

// 分辨率因子 2^(zoom - 18)
[[nodiscard]] double baiduResolution(int zoom) noexcept;

// 低级别下可能得到负数或超出金字塔的编号，属于正常结果
[[nodiscard]] TileAddress baiduCoordToTile(int zoom, const geo::BdCoord& coord) noexcept;

// 百度瓦片左下角的 BD-09 坐标
[[nodiscard]] geo::BdCoord baiduTileToCoord(int zoom, std::int64_t x, std::int64_t y) noexcept;

} // namespace coordshift::tile
