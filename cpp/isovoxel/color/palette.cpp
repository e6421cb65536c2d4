#include "isovoxel/color/palette.h"

namespace isovoxel {

const std::array<PaletteEntry, kPaletteSize>& techPalette() noexcept {
    static const std::array<PaletteEntry, kPaletteSize> kPalette = {{
        {"Electric Blue", Color{0x3B, 0x82, 0xF6}, 4.5f},
        {"Cyber Purple", Color{0x8B, 0x5C, 0xF6}, 4.6f},
        {"Matrix Green", Color{0x10, 0xB9, 0x81}, 4.7f},
        {"Neon Orange", Color{0xF5, 0x9E, 0x0B}, 4.5f},
        {"Tech Teal", Color{0x14, 0xB8, 0xA6}, 4.8f},
        {"Deep Slate", Color{0x47, 0x55, 0x69}, 7.1f},
    }};
    return kPalette;
}

EngineError paletteColor(std::uint32_t slot, Color& out) noexcept {
    if (slot == 0 || slot > kPaletteSize) return EngineError::InvalidOperation;
    out = techPalette()[slot - 1].color;
    return EngineError::Ok;
}

} // namespace isovoxel
