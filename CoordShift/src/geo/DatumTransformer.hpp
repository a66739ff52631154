#pragma once

#include "Datum.hpp"
#include <algorithm>
#include <iterator>
#include <type_traits>
#include <vector>

namespace coordshift::geo {

// 坐标转换器：源/目标坐标系在编译期确定
template<typename From, typename To>
class DatumTransformer {
public:
    explicit DatumTransformer(Precision precision = Precision::Fast, bool checkChina = true)
        : precision_(precision), checkChina_(checkChina) {}

    Precision precision() const noexcept { return precision_; }
    bool checkChina() const noexcept { return checkChina_; }

    // 转换单个点
    [[nodiscard]] Coordinate<To> transform(const Coordinate<From>& point) const noexcept {
        [[maybe_unused]] const bool precise = precision_ == Precision::Precise;

        if constexpr (std::is_same_v<From, To>) {
            return point;
        } else if constexpr (std::is_same_v<From, Wgs84> && std::is_same_v<To, Gcj02>) {
            return wgsToGcj(point, checkChina_);
        } else if constexpr (std::is_same_v<From, Wgs84> && std::is_same_v<To, Bd09>) {
            return wgsToBd(point, checkChina_);
        } else if constexpr (std::is_same_v<From, Gcj02> && std::is_same_v<To, Bd09>) {
            return gcjToBd(point);
        } else if constexpr (std::is_same_v<From, Gcj02> && std::is_same_v<To, Wgs84>) {
            return precise ? gcjToWgsPrecise(point, checkChina_) : gcjToWgs(point, checkChina_);
        } else if constexpr (std::is_same_v<From, Bd09> && std::is_same_v<To, Gcj02>) {
            return precise ? bdToGcjPrecise(point) : bdToGcj(point);
        } else {
            return precise ? bdToWgsPrecise(point, checkChina_) : bdToWgs(point, checkChina_);
        }
    }

    // 批量转换
    [[nodiscard]] std::vector<Coordinate<To>> transform(const std::vector<Coordinate<From>>& points) const {
        std::vector<Coordinate<To>> result;
        result.reserve(points.size());

        std::transform(points.begin(), points.end(), std::back_inserter(result),
                       [this](const Coordinate<From>& point) { return transform(point); });

        return result;
    }

private:
    Precision precision_;
    bool checkChina_;
};

using WgsToGcjTransformer = DatumTransformer<Wgs84, Gcj02>;
using GcjToWgsTransformer = DatumTransformer<Gcj02, Wgs84>;
using WgsToBdTransformer = DatumTransformer<Wgs84, Bd09>;
using BdToWgsTransformer = DatumTransformer<Bd09, Wgs84>;
using GcjToBdTransformer = DatumTransformer<Gcj02, Bd09>;
using BdToGcjTransformer = DatumTransformer<Bd09, Gcj02>;

} // namespace coordshift::geo
