#pragma once

#include "Coordinate.hpp"
#include <gmpxx.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace coordshift::geo {

// 任意精度十进制数
using Decimal = mpq_class;

// 调用方传入的原始经纬度值
//   std::monostate  缺失或不支持的类型（null、map、list 等），一律拒绝
//   std::int64_t    整数
//   double          浮点数
//   Decimal         任意精度十进制数
//   std::string     数字字符串（支持科学计数法，不允许首尾空白或多余字符）
using RawValue = std::variant<std::monostate, std::int64_t, double, Decimal, std::string>;

// 经纬度取值范围（闭区间）
inline constexpr double kMinLatitude = -90.0;
inline constexpr double kMaxLatitude = 90.0;
inline constexpr double kMinLongitude = -180.0;
inline constexpr double kMaxLongitude = 180.0;

// 规范化输入坐标
//
// 两个参数必须是同一种类型，任何一项无法解析或超出范围都返回 std::nullopt，不抛异常。
[[nodiscard]] std::optional<LatLon> normalizeValues(const RawValue& lat, const RawValue& lon);

template<typename Tag = Wgs84>
[[nodiscard]] std::optional<Coordinate<Tag>> normalize(const RawValue& lat, const RawValue& lon) {
    const auto values = normalizeValues(lat, lon);
    if (!values) {
        return std::nullopt;
    }
    return Coordinate<Tag>{values->lat, values->lon};
}

// 解析完整的数字字符串；下溢的极小值得到 0，上溢返回 nullopt
[[nodiscard]] std::optional<double> parseNumber(std::string_view text) noexcept;

// 把十进制数字字符串解析为精确的 Decimal
// 量级低于 1e-1000 的值记为 0，高于 1e1000 的值返回 nullopt
[[nodiscard]] std::optional<Decimal> parseDecimal(std::string_view text);

// 经纬度范围校验
[[nodiscard]] constexpr bool isValidRange(double lat, double lon) noexcept {
    return lat >= kMinLatitude && lat <= kMaxLatitude &&
           lon >= kMinLongitude && lon <= kMaxLongitude;
}

} // namespace coordshift::geo
