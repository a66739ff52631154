#pragma once

#include "GeoBBox.hpp"

namespace coordshift::geo {

// 粗略的中国范围矩形，只用于判断是否需要加偏，不代表实际国界
inline constexpr GeoBBox kChinaBounds{72.004, 0.8293, 137.8347, 55.8271};

template<typename Tag>
[[nodiscard]] constexpr bool sanityInChina(const Coordinate<Tag>& coord) noexcept {
    return kChinaBounds.contains(coord);
}

} // namespace coordshift::geo
