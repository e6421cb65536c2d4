#ifndef ISOVOXEL_RENDER_SCENE_COMPOSER_H
#define ISOVOXEL_RENDER_SCENE_COMPOSER_H

#include "isovoxel/core/types.h"
#include "isovoxel/render/scene_types.h"

#include <cstdint>
#include <vector>

class VoxelStore;

namespace isovoxel {

// Painter key: y + x * kSortRowStride. Only ordered correctly while the grid
// extent stays below kSortRowStride on both axes.
inline std::int32_t painterOrderKey(const Voxel& v) noexcept {
    return v.y + v.x * kSortRowStride;
}

// Axis-aligned bounds of all 8 projected corners (top + base quad) of each voxel.
struct SceneBounds {
    float minX;
    float minY;
    float maxX;
    float maxY;
    bool valid;
};

SceneBounds computeSceneBounds(const std::vector<Voxel>& voxels) noexcept;

/**
 * Compose the ordered face list for a set of voxels.
 * - No voxels: zero faces, default viewport {0, 0, 400, 400}.
 * - Voxels are sorted by painterOrderKey ascending; each emits right, left, top.
 * - Viewport is the corner bounding box grown by kViewportPadding on every side.
 * The input is not modified.
 */
Scene composeScene(const std::vector<Voxel>& voxels, float lightingAngleDeg);
Scene composeScene(const VoxelStore& store, float lightingAngleDeg);

} // namespace isovoxel

#endif // ISOVOXEL_RENDER_SCENE_COMPOSER_H
