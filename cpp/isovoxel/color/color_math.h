#pragma once

#include "isovoxel/core/types.h"

#include <string>
#include <string_view>

namespace isovoxel {

/**
 * Parse `#RRGGBB` (case-insensitive, leading '#' optional).
 * Returns EngineError::InvalidColor and leaves `out` untouched on malformed input.
 */
EngineError parseColor(std::string_view hex, Color& out) noexcept;

// Lowercase "#rrggbb".
std::string toHex(const Color& color);

/**
 * Add `amount` to each channel independently, clamped to [0,255].
 * Fractional results are truncated toward zero after clamping; the sum is
 * kept in double so sub-float offsets still decide the truncation.
 * A NaN amount yields 0 for every channel.
 */
Color adjustBrightness(const Color& color, double amount) noexcept;
EngineError adjustBrightness(std::string_view hex, double amount, std::string& out);

// WCAG 2.x relative luminance, channels in [0,255].
double relativeLuminance(std::uint8_t r, std::uint8_t g, std::uint8_t b) noexcept;
double relativeLuminance(const Color& color) noexcept;

// (lighter + 0.05) / (darker + 0.05); in [1, 21].
double contrastRatio(const Color& a, const Color& b) noexcept;
EngineError contrastRatio(std::string_view hexA, std::string_view hexB, double& out) noexcept;

} // namespace isovoxel
