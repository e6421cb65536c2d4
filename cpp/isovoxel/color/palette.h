#pragma once

#include "isovoxel/core/types.h"

#include <array>
#include <cstddef>
#include <cstdint>

namespace isovoxel {

struct PaletteEntry {
    const char* name;
    Color color;
    // Contrast against white as advertised in the swatch tooltip ("4.5:1" -> 4.5).
    float advertisedContrast;
};

static constexpr std::size_t kPaletteSize = 6;

const std::array<PaletteEntry, kPaletteSize>& techPalette() noexcept;

// 1-based slot, matching the number-key shortcuts. InvalidOperation outside [1, kPaletteSize].
EngineError paletteColor(std::uint32_t slot, Color& out) noexcept;

} // namespace isovoxel
