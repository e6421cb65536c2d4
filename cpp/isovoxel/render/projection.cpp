#include "isovoxel/render/projection.h"

#include <cmath>

namespace isovoxel {

namespace {
    const double kCosIso = std::cos(kIsoAngleRad);
    const double kSinIso = std::sin(kIsoAngleRad);
}

Point2 project(double x, double y, double z) noexcept {
    const double isoX = (x - y) * kCosIso * kIsoScale;
    const double isoY = (x + y) * kSinIso * kIsoScale - z * kIsoScale;
    return Point2{static_cast<float>(isoX), static_cast<float>(isoY)};
}

std::array<Point2, 4> projectCellQuad(std::int32_t x, std::int32_t y, double z) noexcept {
    const double x0 = static_cast<double>(x);
    const double y0 = static_cast<double>(y);
    return {
        project(x0, y0, z),
        project(x0 + 1.0, y0, z),
        project(x0 + 1.0, y0 + 1.0, z),
        project(x0, y0 + 1.0, z),
    };
}

} // namespace isovoxel
