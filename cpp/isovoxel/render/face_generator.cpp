#include "isovoxel/render/face_generator.h"
#include "isovoxel/render/projection.h"
#include "isovoxel/color/color_math.h"

#include <cmath>

namespace isovoxel {

namespace {
    constexpr double kPi = 3.14159265358979323846;
}

float wrapAngleDegrees(float degrees) noexcept {
    if (!std::isfinite(degrees)) return 0.0f;
    float wrapped = std::fmod(degrees, 360.0f);
    if (wrapped < 0.0f) wrapped += 360.0f;
    // fmod of a tiny negative value can round back up to 360
    if (wrapped >= 360.0f) wrapped = 0.0f;
    return wrapped;
}

// Kept in double; the fill truncates the exact channel sum.
double faceLightingOffset(FaceKind kind, float lightingAngleDeg) noexcept {
    const double rad = (static_cast<double>(wrapAngleDegrees(lightingAngleDeg)) * kPi) / 180.0;
    switch (kind) {
        case FaceKind::Top: return 0.0;
        case FaceKind::Left: return -20.0 + std::sin(rad) * 10.0;
        case FaceKind::Right: return -30.0 + std::cos(rad) * 10.0;
        default: return 0.0;
    }
}

Face buildVoxelFace(const Voxel& voxel, FaceKind kind, float lightingAngleDeg) noexcept {
    const double x = static_cast<double>(voxel.x);
    const double y = static_cast<double>(voxel.y);
    const double h = static_cast<double>(voxel.height);

    Face face{};
    face.kind = kind;
    face.fill = adjustBrightness(voxel.color, faceLightingOffset(kind, lightingAngleDeg));

    switch (kind) {
        case FaceKind::Top:
            face.polygon = projectCellQuad(voxel.x, voxel.y, h);
            break;
        case FaceKind::Left:
            face.polygon = {
                project(x, y, h),
                project(x, y + 1.0, h),
                project(x, y + 1.0, 0.0),
                project(x, y, 0.0),
            };
            break;
        case FaceKind::Right:
            face.polygon = {
                project(x + 1.0, y, h),
                project(x + 1.0, y + 1.0, h),
                project(x + 1.0, y + 1.0, 0.0),
                project(x + 1.0, y, 0.0),
            };
            break;
    }
    return face;
}

} // namespace isovoxel
