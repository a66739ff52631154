#include "geo/CoordFormat.hpp"
#include "geo/Normalizer.hpp"
#include <fmt/format.h>
#include <bit>
#include <cmath>

namespace coordshift::geo {

namespace {
    // FNV-1a 32 位参数
    // http://www.isthe.com/chongo/tech/comp/fnv/
    constexpr std::uint32_t kFnvOffsetBasis = 2166136261u;
    constexpr std::uint32_t kFnvPrime = 16777619u;

    // double 的最短十进制表示不超过这么多位小数
    constexpr int kMaxFractionDigits = 350;

    // 按小端字节序累加 double 的 IEEE-754 位模式
    std::uint32_t fnv1a(std::uint32_t h, double value) noexcept {
        // 统一 +0.0 与 -0.0
        const std::uint64_t bits = std::bit_cast<std::uint64_t>(value == 0.0 ? 0.0 : value);
        for (int i = 0; i < 8; ++i) {
            h ^= static_cast<std::uint8_t>(bits >> (8 * i));
            h *= kFnvPrime;
        }
        return h;
    }
}

double roundTo(double value, int precision) {
    if (!std::isfinite(value) || precision < 0 || precision > kMaxFractionDigits) {
        return value;
    }

    // value * 10^p 在二进制下不精确，改为对最短十进制表示做精确舍入
    const auto decimal = parseDecimal(fmt::format("{}", value));
    if (!decimal) {
        return value;
    }

    mpz_class scale;
    mpz_ui_pow_ui(scale.get_mpz_t(), 10, static_cast<unsigned long>(precision));

    // floor(|v| * 10^p + 1/2)
    const Decimal scaled = abs(*decimal) * Decimal{scale};
    const mpz_class rounded = (2 * scaled.get_num() + scaled.get_den()) / (2 * scaled.get_den());

    std::string digits = rounded.get_str();
    if (precision > 0) {
        const auto places = static_cast<size_t>(precision);
        if (digits.size() <= places) {
            digits.insert(0, places + 1 - digits.size(), '0');
        }
        digits.insert(digits.size() - places, 1, '.');
    }

    const auto result = parseNumber(digits);
    if (!result) {
        return value;
    }
    return *decimal < 0 && *result != 0.0 ? -*result : *result;
}

std::uint32_t hashLatLon(double lat, double lon) noexcept {
    std::uint32_t h = kFnvOffsetBasis;
    h = fnv1a(h, lat);
    h = fnv1a(h, lon);
    return h;
}

std::string toString(double lat, double lon, int precision) {
    return fmt::format("{:.{}f},{:.{}f}", roundTo(lat, precision), precision, roundTo(lon, precision), precision);
}

} // namespace coordshift::geo
