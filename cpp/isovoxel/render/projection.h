#pragma once

#include "isovoxel/core/types.h"

#include <array>

namespace isovoxel {

// Fixed 30-degree isometric projection, scale kIsoScale:
//   isoX = (x - y) * cos(30) * S
//   isoY = (x + y) * sin(30) * S - z * S
// Grid bounds are not checked here.
Point2 project(double x, double y, double z) noexcept;

// Corner order: (x,y) (x+1,y) (x+1,y+1) (x,y+1), all at height z.
std::array<Point2, 4> projectCellQuad(std::int32_t x, std::int32_t y, double z) noexcept;

} // namespace isovoxel
