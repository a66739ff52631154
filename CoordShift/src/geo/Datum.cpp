#define _USE_MATH_DEFINES
#include "geo/Datum.hpp"
#include "geo/ChinaBounds.hpp"
#include "geo/DatumTransformer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

namespace coordshift::geo {

namespace {

    // 加偏扭曲函数，输入 (x = lon - 105, y = lat - 35)，返回以米为单位的偏移
    struct Distortion {
        double dLatMeters;
        double dLonMeters;
    };

    Distortion calculateDistortions(double x, double y) noexcept {
        const double dLat =
            -100 + 2 * x + 3 * y + 0.2 * y * y + 0.1 * x * y +
            0.2 * std::sqrt(std::abs(x)) +
            (2 * std::sin(x * 6 * M_PI) + 2 * std::sin(x * 2 * M_PI) +
             2 * std::sin(y * M_PI) + 4 * std::sin(y / 3 * M_PI) +
             16 * std::sin(y / 12 * M_PI) + 32 * std::sin(y / 30 * M_PI)) * 20 / 3;

        const double dLon =
            300 + x + 2 * y + 0.1 * x * x + 0.1 * x * y +
            0.1 * std::sqrt(std::abs(x)) +
            (2 * std::sin(x * 6 * M_PI) + 2 * std::sin(x * 2 * M_PI) +
             2 * std::sin(x * M_PI) + 4 * std::sin(x / 3 * M_PI) +
             15 * std::sin(x / 12 * M_PI) + 30 * std::sin(x / 30 * M_PI)) * 20 / 3;

        return {dLat, dLon};
    }

    // 不动点迭代：从近似反算结果出发，反复用正向变换修正估计值
    template<typename Target, typename Estimate, typename Forward>
    Coordinate<Estimate> iterateInverse(const Coordinate<Target>& target,
                                        Coordinate<Estimate> curr,
                                        Forward&& forward) noexcept {
        CoordDelta diff{};
        for (int i = 0; i < kPreciseMaxIterations; ++i) {
            diff = forward(curr) - target;
            if (std::max(std::abs(diff.dLat), std::abs(diff.dLon)) <= kPreciseEpsilon) {
                return curr;
            }
            curr = curr - diff;
        }

        // 达到上限仍未收敛，按约定返回当前估计
        spdlog::debug("{} -> {} inverse did not converge after {} iterations "
                      "(target {:.8f},{:.8f}; last residual {:.3e},{:.3e})",
                      Target::name, Estimate::name, kPreciseMaxIterations,
                      target.lat, target.lon, diff.dLat, diff.dLon);
        return curr;
    }

} // namespace

GcjCoord wgsToGcj(const WgsCoord& wgs, bool checkChina) noexcept {
    if (checkChina && !sanityInChina(wgs)) {
        // 非中国坐标不加偏
        return GcjCoord{wgs.lat, wgs.lon};
    }

    const auto [dLatMeters, dLonMeters] = calculateDistortions(wgs.lon - 105, wgs.lat - 35);

    const double radLat = wgs.lat / 180 * M_PI;
    const double magic = 1 - kKrasovskyEE * std::pow(std::sin(radLat), 2);

    // 该纬度处每度对应的子午线弧长与纬线弧长
    const double latDegArclen = M_PI / 180 * (kKrasovskyA * (1 - kKrasovskyEE)) / std::pow(magic, 1.5);
    const double lonDegArclen = M_PI / 180 * (kKrasovskyA * std::cos(radLat) / std::sqrt(magic));

    return GcjCoord{
        wgs.lat + dLatMeters / latDegArclen,
        wgs.lon + dLonMeters / lonDegArclen
    };
}

WgsCoord gcjToWgs(const GcjCoord& gcj, bool checkChina) noexcept {
    // 把 GCJ 值当作 WGS 再加偏一次，用偏移量近似反推
    const WgsCoord asWgs{gcj.lat, gcj.lon};
    const CoordDelta diff = wgsToGcj(asWgs, checkChina) - gcj;
    return asWgs - diff;
}

BdCoord gcjToBd(const GcjCoord& gcj) noexcept {
    const double x = gcj.lon;
    const double y = gcj.lat;

    const double r = std::sqrt(x * x + y * y) + 0.00002 * std::sin(y * M_PI * 3000 / 180);
    const double theta = std::atan2(y, x) + 0.000003 * std::cos(x * M_PI * 3000 / 180);

    return BdCoord{
        r * std::sin(theta) + kBdDeltaLat,
        r * std::cos(theta) + kBdDeltaLon
    };
}

GcjCoord bdToGcj(const BdCoord& bd) noexcept {
    const double x = bd.lon - kBdDeltaLon;
    const double y = bd.lat - kBdDeltaLat;

    const double r = std::sqrt(x * x + y * y) - 0.00002 * std::sin(y * M_PI * 3000 / 180);
    const double theta = std::atan2(y, x) - 0.000003 * std::cos(x * M_PI * 3000 / 180);

    return GcjCoord{r * std::sin(theta), r * std::cos(theta)};
}

WgsCoord bdToWgs(const BdCoord& bd, bool checkChina) noexcept {
    return gcjToWgs(bdToGcj(bd), checkChina);
}

BdCoord wgsToBd(const WgsCoord& wgs, bool checkChina) noexcept {
    return gcjToBd(wgsToGcj(wgs, checkChina));
}

WgsCoord gcjToWgsPrecise(const GcjCoord& gcj, bool checkChina) noexcept {
    return iterateInverse(gcj, gcjToWgs(gcj, checkChina),
                          [checkChina](const WgsCoord& c) { return wgsToGcj(c, checkChina); });
}

GcjCoord bdToGcjPrecise(const BdCoord& bd) noexcept {
    return iterateInverse(bd, bdToGcj(bd),
                          [](const GcjCoord& c) { return gcjToBd(c); });
}

WgsCoord bdToWgsPrecise(const BdCoord& bd, bool checkChina) noexcept {
    return iterateInverse(bd, bdToWgs(bd, checkChina),
                          [checkChina](const WgsCoord& c) { return wgsToBd(c, checkChina); });
}

namespace {

    template<typename D>
    Coordinate<D> tagged(LatLon coord) noexcept {
        return Coordinate<D>{coord.lat, coord.lon};
    }

    template<typename D>
    LatLon untagged(const Coordinate<D>& coord) noexcept {
        return LatLon{coord.lat, coord.lon};
    }

    template<typename From, typename To>
    LatLon convertTyped(LatLon coord, Precision precision, bool checkChina) noexcept {
        const DatumTransformer<From, To> transformer{precision, checkChina};
        return untagged(transformer.transform(tagged<From>(coord)));
    }

    template<typename From>
    LatLon convertFrom(Datum to, LatLon coord, Precision precision, bool checkChina) noexcept {
        switch (to) {
            case Datum::Wgs84: return convertTyped<From, Wgs84>(coord, precision, checkChina);
            case Datum::Gcj02: return convertTyped<From, Gcj02>(coord, precision, checkChina);
            case Datum::Bd09:  return convertTyped<From, Bd09>(coord, precision, checkChina);
        }
        return coord;
    }

} // namespace

LatLon convertCoordinate(Datum from, Datum to, LatLon coord,
                         Precision precision, bool checkChina) noexcept {
    switch (from) {
        case Datum::Wgs84: return convertFrom<Wgs84>(to, coord, precision, checkChina);
        case Datum::Gcj02: return convertFrom<Gcj02>(to, coord, precision, checkChina);
        case Datum::Bd09:  return convertFrom<Bd09>(to, coord, precision, checkChina);
    }
    return coord;
}

std::string_view datumName(Datum datum) noexcept {
    switch (datum) {
        case Datum::Wgs84: return Wgs84::name;
        case Datum::Gcj02: return Gcj02::name;
        case Datum::Bd09:  return Bd09::name;
    }
    return "unknown";
}

std::expected<Datum, DatumError> parseDatum(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static constexpr std::array<Datum, 3> datums{Datum::Wgs84, Datum::Gcj02, Datum::Bd09};
    for (const auto datum : datums) {
        if (lowered == datumName(datum)) {
            return datum;
        }
    }

    return std::unexpected(DatumError::UnknownDatum);
}

std::vector<std::string> getSupportedDatums() {
    return {
        std::string{Wgs84::name},
        std::string{Gcj02::name},
        std::string{Bd09::name},
    };
}

} // namespace coordshift::geo
