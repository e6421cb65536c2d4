#pragma once

#include "isovoxel/render/scene_types.h"

#include <string>
#include <string_view>

namespace isovoxel {

// Root <svg> sized to the scene viewport, one filled+stroked <path> per face in
// scene order. An empty scene yields a bare 400x400 document.
std::string writeSvg(const Scene& scene);

// Collapse whitespace runs to a single space, drop whitespace between tags, trim.
std::string optimizeSvg(std::string_view svg);

} // namespace isovoxel
