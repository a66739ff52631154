#include "tile/TileSource.hpp"
#include <spdlog/spdlog.h>
#include <array>
#include <cstdlib>

namespace coordshift::tile {

namespace {

    const std::array<TileSourceInfo, 5>& tileSources() {
        static const std::array<TileSourceInfo, 5> sources{{
            {Provider::OpenStreetMap, "OpenStreetMap", geo::Datum::Wgs84,
             "https://{s}.tile.osm.org/{z}/{x}/{y}.png",
             {"a", "b", "c"}},
            {Provider::Amap, "Amap", geo::Datum::Gcj02,
             "https://webrd0{s}.is.autonavi.com/appmaptile?z={z}&x={x}&y={y}&lang=zh_cn&size=1&scale=1&style=7",
             {"1", "2", "3", "4"}},
            {Provider::Baidu, "Baidu", geo::Datum::Bd09,
             "https://maponline{s}.bdimg.com/tile/?qt=vtile&z={z}&x={x}&y={y}&styles=pl&scaler=1",
             {"0", "1", "2", "3"}},
            {Provider::Google, "Google", geo::Datum::Gcj02,
             "https://mt{s}.google.com/vt/?lyrs=m&hl=zh&gl=cn&z={z}&x={x}&y={y}",
             {"0", "1", "2", "3"}},
            // 腾讯使用 TMS 行序
            {Provider::Tencent, "Tencent", geo::Datum::Gcj02,
             "https://rt{s}.map.gtimg.com/tile?z={z}&x={x}&y={-y}&type=vector&styleid=1",
             {"0", "1", "2", "3"}},
        }};
        return sources;
    }

    void replaceAll(std::string& text, std::string_view pattern, const std::string& value) {
        size_t pos = 0;
        while ((pos = text.find(pattern, pos)) != std::string::npos) {
            text.replace(pos, pattern.size(), value);
            pos += value.size();
        }
    }

    // 按 |x + y| 轮换子域名，同一瓦片总是落在同一子域名
    std::string_view pickSubdomain(const TileSourceInfo& info, const TileAddress& tile) noexcept {
        if (info.subdomains.empty()) {
            return {};
        }
        const auto sum = tile.x + tile.y;
        const auto index = static_cast<size_t>(sum < 0 ? -sum : sum) % info.subdomains.size();
        return info.subdomains[index];
    }

} // namespace

TileSourceConfig TileSourceConfig::fromEnvironment() {
    TileSourceConfig config;

    const char* value = std::getenv(std::string{kTileSourceEnvVar}.c_str());
    if (value == nullptr || *value == '\0') {
        return config;
    }

    if (auto provider = parseProvider(value)) {
        config.defaultProvider = *provider;
    } else {
        spdlog::warn("Unknown tile source '{}' in {}, using {}", value, kTileSourceEnvVar,
                     providerName(config.defaultProvider));
    }

    return config;
}

const TileSourceInfo& tileSourceInfo(Provider provider) noexcept {
    const auto& sources = tileSources();
    for (const auto& info : sources) {
        if (info.provider == provider) {
            return info;
        }
    }
    return sources.front();
}

std::string_view providerName(Provider provider) noexcept {
    return tileSourceInfo(provider).name;
}

std::expected<Provider, TileSourceError> parseProvider(std::string_view name) {
    for (const auto& info : tileSources()) {
        if (info.name == name) {
            return info.provider;
        }
    }
    return std::unexpected(TileSourceError::UnknownProvider);
}

Provider resolveProvider(std::string_view name, Provider fallback) {
    if (name.empty()) {
        return fallback;
    }
    return parseProvider(name).value_or(fallback);
}

std::vector<std::string> getSupportedProviders() {
    std::vector<std::string> names;
    for (const auto& info : tileSources()) {
        names.emplace_back(info.name);
    }
    return names;
}

TileAddress resolveProviderTile(Provider provider, const TileAddress& wgsTile) noexcept {
    switch (tileSourceInfo(provider).datum) {
        case geo::Datum::Bd09:
            return wgsToBd(wgsTile);
        case geo::Datum::Gcj02:
            return wgsToGcj(wgsTile);
        case geo::Datum::Wgs84:
            break;
    }
    return wgsTile;
}

std::string buildTileUrl(Provider provider, const TileAddress& tile) {
    const auto& info = tileSourceInfo(provider);
    std::string url{info.urlTemplate};

    // 先替换 {-y}，避免与 {y} 混淆
    replaceAll(url, "{-y}", std::to_string(tmsConvertY(tile.zoom, tile.y)));
    replaceAll(url, "{z}", std::to_string(tile.zoom));
    replaceAll(url, "{x}", std::to_string(tile.x));
    replaceAll(url, "{y}", std::to_string(tile.y));
    replaceAll(url, "{s}", std::string{pickSubdomain(info, tile)});

    spdlog::trace("Tile URL for {} {}/{}/{}: {}", info.name, tile.zoom, tile.x, tile.y, url);
    return url;
}

} // namespace coordshift::tile
