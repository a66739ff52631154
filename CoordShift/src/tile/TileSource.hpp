#pragma once

#include "TileConverter.hpp"
#include "../geo/Datum.hpp"
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace coordshift::tile {

// 瓦片服务提供商
enum class Provider {
    OpenStreetMap,
    Amap,
    Baidu,
    Google,
    Tencent
};

enum class TileSourceError {
    UnknownProvider
};

// 提供商的瓦片规格
struct TileSourceInfo {
    Provider provider;
    std::string_view name;
    geo::Datum datum;                      // 瓦片内容使用的坐标系
    std::string_view urlTemplate;          // {s} {z} {x} {y} {-y}
    std::vector<std::string_view> subdomains;
};

// 提供商配置
struct TileSourceConfig {
    Provider defaultProvider{Provider::OpenStreetMap};

    // 环境变量 MAP_TILE_SOURCE 覆盖默认提供商，无法识别时保持默认
    static TileSourceConfig fromEnvironment();
};

inline constexpr std::string_view kTileSourceEnvVar = "MAP_TILE_SOURCE";

[[nodiscard]] const TileSourceInfo& tileSourceInfo(Provider provider) noexcept;

[[nodiscard]] std::string_view providerName(Provider provider) noexcept;

// 按名称查找提供商（区分大小写，如 "Baidu"）
[[nodiscard]] std::expected<Provider, TileSourceError> parseProvider(std::string_view name);

// 名称为空或无法识别时退回 fallback
[[nodiscard]] Provider resolveProvider(std::string_view name, Provider fallback);

[[nodiscard]] std::vector<std::string> getSupportedProviders();

// 把 WGS-84 标准瓦片换算为提供商自身的瓦片编号
[[nodiscard]] TileAddress resolveProviderTile(Provider provider, const TileAddress& wgsTile) noexcept;

// 用提供商模板生成瓦片 URL，tile 须已是提供商的瓦片编号
[[nodiscard]] std::string buildTileUrl(Provider provider, const TileAddress& tile);

} // namespace coordshift::tile
