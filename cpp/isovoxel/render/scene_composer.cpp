#include "isovoxel/render/scene_composer.h"
#include "isovoxel/render/face_generator.h"
#include "isovoxel/render/projection.h"
#include "isovoxel/entity/voxel_store.h"

#include <algorithm>
#include <limits>

namespace isovoxel {

namespace {
    constexpr FaceKind kFaceEmitOrder[] = {FaceKind::Right, FaceKind::Left, FaceKind::Top};

    void growBounds(SceneBounds& b, const Point2& p) noexcept {
        b.minX = std::min(b.minX, p.x);
        b.minY = std::min(b.minY, p.y);
        b.maxX = std::max(b.maxX, p.x);
        b.maxY = std::max(b.maxY, p.y);
    }
}

SceneBounds computeSceneBounds(const std::vector<Voxel>& voxels) noexcept {
    SceneBounds b{
        std::numeric_limits<float>::infinity(),
        std::numeric_limits<float>::infinity(),
        -std::numeric_limits<float>::infinity(),
        -std::numeric_limits<float>::infinity(),
        false,
    };
    for (const Voxel& v : voxels) {
        const auto top = projectCellQuad(v.x, v.y, static_cast<double>(v.height));
        const auto base = projectCellQuad(v.x, v.y, 0.0);
        for (const Point2& p : top) growBounds(b, p);
        for (const Point2& p : base) growBounds(b, p);
        b.valid = true;
    }
    return b;
}

Scene composeScene(const std::vector<Voxel>& voxels, float lightingAngleDeg) {
    Scene scene{};
    if (voxels.empty()) return scene;

    std::vector<Voxel> sorted = voxels;
    std::stable_sort(sorted.begin(), sorted.end(), [](const Voxel& a, const Voxel& b) {
        return painterOrderKey(a) < painterOrderKey(b);
    });

    scene.faces.reserve(sorted.size() * 3);
    for (const Voxel& v : sorted) {
        for (const FaceKind kind : kFaceEmitOrder) {
            scene.faces.push_back(buildVoxelFace(v, kind, lightingAngleDeg));
        }
    }

    const SceneBounds b = computeSceneBounds(sorted);
    scene.viewport.x = b.minX - kViewportPadding;
    scene.viewport.y = b.minY - kViewportPadding;
    scene.viewport.width = (b.maxX - b.minX) + kViewportPadding * 2.0f;
    scene.viewport.height = (b.maxY - b.minY) + kViewportPadding * 2.0f;
    return scene;
}

Scene composeScene(const VoxelStore& store, float lightingAngleDeg) {
    return composeScene(store.voxels(), lightingAngleDeg);
}

} // namespace isovoxel
