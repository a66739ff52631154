#pragma once

#include "Coordinate.hpp"
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace coordshift::geo {

// 运行时坐标系标识，与 Wgs84/Gcj02/Bd09 标签一一对应
enum class Datum {
    Wgs84,
    Gcj02,
    Bd09
};

enum class DatumError {
    UnknownDatum
};

// 反算精度
enum class Precision {
    Fast,     // 单步近似，误差约 1~2 米
    Precise   // 不动点迭代
};

// Krasovsky 1940 椭球体常数
inline constexpr double kKrasovskyA = 6378245.0;
// f = 1/298.3; e^2 = 2f - f^2
inline constexpr double kKrasovskyEE = 0.00669342162296594323;

// 百度的人工偏差
inline constexpr double kBdDeltaLat = 0.0060;
inline constexpr double kBdDeltaLon = 0.0065;

// 迭代反算的收敛阈值（度）与最大迭代次数
inline constexpr double kPreciseEpsilon = 1.0e-5;
inline constexpr int kPreciseMaxIterations = 10;

// WGS-84 -> GCJ-02，checkChina 为 true 且不在中国范围内时原样返回
[[nodiscard]] GcjCoord wgsToGcj(const WgsCoord& wgs, bool checkChina = true) noexcept;

// GCJ-02 -> WGS-84（单步近似）
[[nodiscard]] WgsCoord gcjToWgs(const GcjCoord& gcj, bool checkChina = true) noexcept;

[[nodiscard]] BdCoord gcjToBd(const GcjCoord& gcj) noexcept;
[[nodiscard]] GcjCoord bdToGcj(const BdCoord& bd) noexcept;

[[nodiscard]] WgsCoord bdToWgs(const BdCoord& bd, bool checkChina = true) noexcept;
[[nodiscard]] BdCoord wgsToBd(const WgsCoord& wgs, bool checkChina = true) noexcept;

// 迭代反算（Caijun 2014），最多 kPreciseMaxIterations 次，未收敛时返回当前最优估计
[[nodiscard]] WgsCoord gcjToWgsPrecise(const GcjCoord& gcj, bool checkChina = true) noexcept;
[[nodiscard]] GcjCoord bdToGcjPrecise(const BdCoord& bd) noexcept;
[[nodiscard]] WgsCoord bdToWgsPrecise(const BdCoord& bd, bool checkChina = true) noexcept;

// 按运行时坐标系转换，from == to 时原样返回
[[nodiscard]] LatLon convertCoordinate(Datum from, Datum to, LatLon coord,
                                       Precision precision = Precision::Fast,
                                       bool checkChina = true) noexcept;

// 辅助函数：坐标系名称
[[nodiscard]] std::string_view datumName(Datum datum) noexcept;

// 辅助函数：从字符串解析坐标系（wgs84 / gcj02 / bd09，不区分大小写）
[[nodiscard]] std::expected<Datum, DatumError> parseDatum(std::string_view name);

// 辅助函数：支持的坐标系列表
[[nodiscard]] std::vector<std::string> getSupportedDatums();

} // namespace coordshift::geo
