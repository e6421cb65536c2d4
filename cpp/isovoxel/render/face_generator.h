#pragma once

#include "isovoxel/core/types.h"
#include "isovoxel/render/scene_types.h"

namespace isovoxel {

// Wrap an angle in degrees to [0, 360).
float wrapAngleDegrees(float degrees) noexcept;

/**
 * Stylized per-face brightness offset (not physically based):
 *   top   -> 0
 *   left  -> -20 + sin(angle) * 10
 *   right -> -30 + cos(angle) * 10
 */
double faceLightingOffset(FaceKind kind, float lightingAngleDeg) noexcept;

/**
 * Build one visible face of `voxel`. Top corners sit at z = height, base corners at z = 0.
 *   top:   (x,y,h) (x+1,y,h) (x+1,y+1,h) (x,y+1,h)
 *   left:  (x,y,h) (x,y+1,h) (x,y+1,0)   (x,y,0)
 *   right: (x+1,y,h) (x+1,y+1,h) (x+1,y+1,0) (x+1,y,0)
 */
Face buildVoxelFace(const Voxel& voxel, FaceKind kind, float lightingAngleDeg) noexcept;

} // namespace isovoxel
