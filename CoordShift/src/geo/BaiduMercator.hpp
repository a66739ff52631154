#pragma once

#include "Coordinate.hpp"

namespace coordshift::geo {

// 百度墨卡托投影 (BD09 <-> BD09MC)
//
// 百度使用按纬度分带的多项式近似代替标准墨卡托公式，系数表来自百度地图 JS API，
// 必须逐位一致，否则与百度瓦片及其 API 返回的平面坐标对不上。
//
// llToMc 会把经度折算到 [-180, 180]，纬度截断到 [-74, 74]。

// 经纬度 -> 平面坐标（米）
[[nodiscard]] MercatorPoint llToMc(double lon, double lat) noexcept;
[[nodiscard]] MercatorPoint llToMc(const BdCoord& coord) noexcept;

// 平面坐标 -> 经纬度
[[nodiscard]] BdCoord mcToLl(double x, double y) noexcept;
[[nodiscard]] BdCoord mcToLl(const MercatorPoint& point) noexcept;

} // namespace coordshift::geo
