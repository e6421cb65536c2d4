#ifndef ISOVOXEL_RENDER_SCENE_TYPES_H
#define ISOVOXEL_RENDER_SCENE_TYPES_H

#include "isovoxel/core/types.h"

#include <array>
#include <cstdint>
#include <vector>

namespace isovoxel {

// Native representation of the exported vector document: one closed quad per
// visible voxel face, already in painter order.

enum class FaceKind : std::uint8_t { Top = 0, Left = 1, Right = 2 };

struct Face {
    FaceKind kind{FaceKind::Top};
    std::array<Point2, 4> polygon{};
    Color fill{};
};

struct Viewport {
    float x{0.0f};
    float y{0.0f};
    float width{kDefaultViewportSize};
    float height{kDefaultViewportSize};
};

// Applied by the renderer to every face outline.
struct StrokeStyle {
    Color color{kFaceStrokeColor};
    float widthPx{kFaceStrokeWidthPx};
};

struct Scene {
    Viewport viewport{};
    StrokeStyle stroke{};
    std::vector<Face> faces;

    bool empty() const noexcept { return faces.empty(); }
};

inline bool operator==(const Face& a, const Face& b) {
    return a.kind == b.kind && a.polygon == b.polygon && a.fill == b.fill;
}
inline bool operator!=(const Face& a, const Face& b) { return !(a == b); }

} // namespace isovoxel

#endif // ISOVOXEL_RENDER_SCENE_TYPES_H
