#include "isovoxel/color/color_math.h"

#include <algorithm>
#include <cmath>

namespace isovoxel {

namespace {
    int hexDigitValue(char c) noexcept {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    std::uint8_t offsetChannel(std::uint8_t c, double amount) noexcept {
        const double sum = static_cast<double>(c) + amount;
        if (std::isnan(sum)) return 0;
        return static_cast<std::uint8_t>(std::clamp(sum, 0.0, 255.0));
    }

    double linearizeChannel(std::uint8_t c) noexcept {
        const double v = static_cast<double>(c) / 255.0;
        return v <= 0.03928 ? v / 12.92 : std::pow((v + 0.055) / 1.055, 2.4);
    }
}

EngineError parseColor(std::string_view hex, Color& out) noexcept {
    if (!hex.empty() && hex.front() == '#') hex.remove_prefix(1);
    if (hex.size() != 6) return EngineError::InvalidColor;

    std::uint8_t channels[3];
    for (std::size_t i = 0; i < 3; ++i) {
        const int hi = hexDigitValue(hex[i * 2]);
        const int lo = hexDigitValue(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) return EngineError::InvalidColor;
        channels[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    out = Color{channels[0], channels[1], channels[2]};
    return EngineError::Ok;
}

std::string toHex(const Color& color) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string s(7, '#');
    const std::uint8_t channels[3] = {color.r, color.g, color.b};
    for (std::size_t i = 0; i < 3; ++i) {
        s[1 + i * 2] = kDigits[channels[i] >> 4];
        s[2 + i * 2] = kDigits[channels[i] & 0x0F];
    }
    return s;
}

Color adjustBrightness(const Color& color, double amount) noexcept {
    return Color{
        offsetChannel(color.r, amount),
        offsetChannel(color.g, amount),
        offsetChannel(color.b, amount),
    };
}

EngineError adjustBrightness(std::string_view hex, double amount, std::string& out) {
    Color c{};
    const EngineError err = parseColor(hex, c);
    if (err != EngineError::Ok) return err;
    out = toHex(adjustBrightness(c, amount));
    return EngineError::Ok;
}

double relativeLuminance(std::uint8_t r, std::uint8_t g, std::uint8_t b) noexcept {
    return 0.2126 * linearizeChannel(r) + 0.7152 * linearizeChannel(g) + 0.0722 * linearizeChannel(b);
}

double relativeLuminance(const Color& color) noexcept {
    return relativeLuminance(color.r, color.g, color.b);
}

double contrastRatio(const Color& a, const Color& b) noexcept {
    const double la = relativeLuminance(a);
    const double lb = relativeLuminance(b);
    const double lighter = std::max(la, lb);
    const double darker = std::min(la, lb);
    return (lighter + 0.05) / (darker + 0.05);
}

EngineError contrastRatio(std::string_view hexA, std::string_view hexB, double& out) noexcept {
    Color a{};
    Color b{};
    if (parseColor(hexA, a) != EngineError::Ok) return EngineError::InvalidColor;
    if (parseColor(hexB, b) != EngineError::Ok) return EngineError::InvalidColor;
    out = contrastRatio(a, b);
    return EngineError::Ok;
}

} // namespace isovoxel
