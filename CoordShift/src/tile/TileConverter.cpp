#define _USE_MATH_DEFINES
#include "tile/TileConverter.hpp"
#include "geo/BaiduMercator.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <charconv>
#include <cmath>

namespace coordshift::tile {

namespace {
    // 合法的缩放级别上限（2^zoom 需能放进 int64）
    constexpr int kMaxZoom = 30;

    // 编号截断到 ±kMaxTileIndex
    std::int64_t floorToIndex(double value) noexcept {
        if (!std::isfinite(value)) {
            return 0;
        }
        const double limit = static_cast<double>(kMaxTileIndex);
        return static_cast<std::int64_t>(std::clamp(std::floor(value), -limit, limit));
    }

    bool parseInteger(std::string_view text, std::int64_t& out) noexcept {
        if (text.empty()) {
            return false;
        }
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
        return ec == std::errc{} && ptr == text.data() + text.size();
    }
}

std::expected<TileAddress, TileParseError> parseTileAddress(std::string_view text) {
    const auto first = text.find('/');
    const auto second = first == std::string_view::npos ? first : text.find('/', first + 1);
    if (second == std::string_view::npos || text.find('/', second + 1) != std::string_view::npos) {
        return std::unexpected(TileParseError::InvalidFormat);
    }

    std::int64_t zoom = 0;
    std::int64_t x = 0;
    std::int64_t y = 0;
    if (!parseInteger(text.substr(0, first), zoom) ||
        !parseInteger(text.substr(first + 1, second - first - 1), x) ||
        !parseInteger(text.substr(second + 1), y)) {
        return std::unexpected(TileParseError::InvalidFormat);
    }

    if (zoom < 0 || zoom > kMaxZoom) {
        return std::unexpected(TileParseError::InvalidZoom);
    }

    return TileAddress{static_cast<int>(zoom), x, y};
}

std::string toString(const TileAddress& tile) {
    return fmt::format("{}/{}/{}", tile.zoom, tile.x, tile.y);
}

TileAddress coordToTile(int zoom, double lat, double lon) noexcept {
    const double latRad = lat * M_PI / 180;
    const double n = std::pow(2.0, zoom);

    const double x = (lon + 180) / 360 * n;
    const double y = (1 - std::asinh(std::tan(latRad)) / M_PI) / 2 * n;

    return TileAddress{zoom, floorToIndex(x), floorToIndex(y)};
}

geo::LatLon tileToLatLon(int zoom, std::int64_t x, std::int64_t y) noexcept {
    const double n = std::pow(2.0, zoom);

    const double lon = static_cast<double>(x) / n * 360 - 180;
    const double latRad = std::atan(std::sinh(M_PI * (1 - 2 * static_cast<double>(y) / n)));

    return geo::LatLon{latRad * 180 / M_PI, lon};
}

geo::GeoBBox tileToBbox(int zoom, std::int64_t x, std::int64_t y) noexcept {
    const auto northWest = tileToLatLon(zoom, x, y);
    const auto southEast = tileToLatLon(zoom, x + 1, y + 1);

    return geo::GeoBBox{
        std::min(northWest.lon, southEast.lon),
        std::min(northWest.lat, southEast.lat),
        std::max(northWest.lon, southEast.lon),
        std::max(northWest.lat, southEast.lat)
    };
}

std::int64_t tmsConvertY(int zoom, std::int64_t y) noexcept {
    const std::int64_t maxTile = floorToIndex(std::pow(2.0, zoom)) - 1;
    return maxTile - y;
}

TileAddress wgsToGcj(const TileAddress& tile) noexcept {
    return tile;
}

TileAddress gcjToWgs(const TileAddress& tile) noexcept {
    return tile;
}

TileAddress wgsToBd(const TileAddress& tile) noexcept {
    // 只换投影：角点经纬度直接按 BD-09 落到百度网格
    const auto corner = tileToLatLon(tile.zoom, tile.x, tile.y);
    return baiduCoordToTile(tile.zoom, geo::BdCoord{corner.lat, corner.lon});
}

TileAddress bdToWgs(const TileAddress& tile) noexcept {
    const auto corner = baiduTileToCoord(tile.zoom, tile.x, tile.y);
    return coordToTile(tile.zoom, corner.lat, corner.lon);
}

double baiduResolution(int zoom) noexcept {
    return std::pow(2.0, zoom - kBaiduBaseZoom);
}

TileAddress baiduCoordToTile(int zoom, const geo::BdCoord& coord) noexcept {
    // BD-09 -> BD09MC
    const auto mercator = geo::llToMc(coord);
    const double resolution = baiduResolution(zoom);

    return TileAddress{
        zoom,
        floorToIndex(mercator.x * resolution / kTileSize),
        floorToIndex(mercator.y * resolution / kTileSize)
    };
}

geo::BdCoord baiduTileToCoord(int zoom, std::int64_t x, std::int64_t y) noexcept {
    const double resolution = baiduResolution(zoom);

    const double mercatorX = static_cast<double>(x) * kTileSize / resolution;
    const double mercatorY = static_cast<double>(y) * kTileSize / resolution;

    return geo::mcToLl(mercatorX, mercatorY);
}

} // namespace coordshift::tile
