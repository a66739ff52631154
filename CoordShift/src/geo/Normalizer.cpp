#include "geo/Normalizer.hpp"
#include <charconv>
#include <cmath>
#include <string>
#include <type_traits>

namespace coordshift::geo {

namespace {

    // 十进制量级上限：更大的值不可能是合法经纬度，更小的值按 0 处理
    constexpr long kMaxDecimalExponent = 1000;

    // 指数部分的饱和值
    constexpr long kExponentLimit = 1'000'000'000;

    // 数字字符串的组成部分：[+-]digits[.digits][(e|E)[+-]digits]
    struct NumberParts {
        bool negative{false};
        std::string_view integerDigits;
        std::string_view fractionDigits;
        long exponent{0};
    };

    bool isDigit(char c) noexcept {
        return c >= '0' && c <= '9';
    }

    size_t scanDigits(std::string_view text, size_t pos) noexcept {
        while (pos < text.size() && isDigit(text[pos])) {
            ++pos;
        }
        return pos;
    }

    std::optional<NumberParts> scanNumber(std::string_view text) noexcept {
        NumberParts parts;
        size_t pos = 0;

        if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
            parts.negative = text[pos] == '-';
            ++pos;
        }

        const size_t integerEnd = scanDigits(text, pos);
        if (integerEnd == pos) {
            return std::nullopt;
        }
        parts.integerDigits = text.substr(pos, integerEnd - pos);
        pos = integerEnd;

        if (pos < text.size() && text[pos] == '.') {
            const size_t fractionEnd = scanDigits(text, pos + 1);
            if (fractionEnd == pos + 1) {
                return std::nullopt;
            }
            parts.fractionDigits = text.substr(pos + 1, fractionEnd - pos - 1);
            pos = fractionEnd;
        }

        if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
            ++pos;
            bool negativeExponent = false;
            if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
                negativeExponent = text[pos] == '-';
                ++pos;
            }

            const size_t exponentEnd = scanDigits(text, pos);
            if (exponentEnd == pos) {
                return std::nullopt;
            }

            long exponent = 0;
            const auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + exponentEnd, exponent);
            if (ptr != text.data() + exponentEnd) {
                return std::nullopt;
            }
            if (ec == std::errc::result_out_of_range || exponent > kExponentLimit) {
                exponent = kExponentLimit;
            } else if (ec != std::errc{}) {
                return std::nullopt;
            }
            parts.exponent = negativeExponent ? -exponent : exponent;
            pos = exponentEnd;
        }

        // 尾部不允许有多余字符
        if (pos != text.size()) {
            return std::nullopt;
        }

        return parts;
    }

    // 返回 m 使 10^(m-1) <= |value| < 10^m；值为 0 时返回 nullopt
    std::optional<long> magnitudeOf(const NumberParts& parts) noexcept {
        const auto integerFirst = parts.integerDigits.find_first_not_of('0');
        if (integerFirst != std::string_view::npos) {
            return static_cast<long>(parts.integerDigits.size() - integerFirst) + parts.exponent;
        }

        const auto fractionFirst = parts.fractionDigits.find_first_not_of('0');
        if (fractionFirst == std::string_view::npos) {
            return std::nullopt;
        }
        return parts.exponent - static_cast<long>(fractionFirst);
    }

    mpz_class powerOfTen(unsigned long exponent) {
        mpz_class result;
        mpz_ui_pow_ui(result.get_mpz_t(), 10, exponent);
        return result;
    }

    bool inRange(const Decimal& lat, const Decimal& lon) {
        return lat >= -90 && lat <= 90 && lon >= -180 && lon <= 180;
    }

    std::optional<LatLon> checked(double lat, double lon) noexcept {
        if (!isValidRange(lat, lon)) {
            return std::nullopt;
        }
        return LatLon{lat, lon};
    }

} // namespace

std::optional<double> parseNumber(std::string_view text) noexcept {
    const auto parts = scanNumber(text);
    if (!parts) {
        return std::nullopt;
    }

    // from_chars 不接受前导 '+'
    if (text.front() == '+') {
        text.remove_prefix(1);
    }

    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc::result_out_of_range && ptr == text.data() + text.size()) {
        // 下溢得到 0，上溢仍然拒绝
        const auto magnitude = magnitudeOf(*parts);
        if (!magnitude || *magnitude < 0) {
            return 0.0;
        }
        return std::nullopt;
    }
    if (ec != std::errc{} || ptr != text.data() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }

    return value;
}

std::optional<Decimal> parseDecimal(std::string_view text) {
    const auto parts = scanNumber(text);
    if (!parts) {
        return std::nullopt;
    }

    // 全零时与指数无关
    const auto magnitude = magnitudeOf(*parts);
    if (!magnitude || *magnitude <= -kMaxDecimalExponent) {
        return Decimal{0};
    }
    if (*magnitude > kMaxDecimalExponent) {
        return std::nullopt;
    }

    const long scale = parts->exponent - static_cast<long>(parts->fractionDigits.size());

    std::string digits{parts->integerDigits};
    digits.append(parts->fractionDigits);

    Decimal value{mpz_class{digits, 10}};
    if (scale > 0) {
        value *= Decimal{powerOfTen(static_cast<unsigned long>(scale))};
    } else if (scale < 0) {
        value /= Decimal{powerOfTen(static_cast<unsigned long>(-scale))};
    }
    value.canonicalize();

    if (parts->negative) {
        value = -value;
    }

    return value;
}

std::optional<LatLon> normalizeValues(const RawValue& lat, const RawValue& lon) {
    // 两个参数必须是同一种表示
    if (lat.index() != lon.index()) {
        return std::nullopt;
    }

    return std::visit([&lon](const auto& latValue) -> std::optional<LatLon> {
        using T = std::decay_t<decltype(latValue)>;
        [[maybe_unused]] const auto& lonValue = std::get<T>(lon);

        if constexpr (std::is_same_v<T, double>) {
            return checked(latValue, lonValue);
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return checked(static_cast<double>(latValue), static_cast<double>(lonValue));
        } else if constexpr (std::is_same_v<T, Decimal>) {
            // 先按精确值校验范围，再转换为 double
            if (!inRange(latValue, lonValue)) {
                return std::nullopt;
            }
            return LatLon{latValue.get_d(), lonValue.get_d()};
        } else if constexpr (std::is_same_v<T, std::string>) {
            const auto latParsed = parseNumber(latValue);
            const auto lonParsed = parseNumber(lonValue);
            if (!latParsed || !lonParsed) {
                return std::nullopt;
            }
            return checked(*latParsed, *lonParsed);
        } else {
            return std::nullopt;
        }
    }, lat);
}

} // namespace coordshift::geo
