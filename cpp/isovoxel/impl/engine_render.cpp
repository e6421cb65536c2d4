// engine_render.cpp - scene composition entry points for VoxelEngine.

#include "isovoxel/engine.h"
#include "isovoxel/render/scene_composer.h"
#include "isovoxel/render/svg_writer.h"
#include "isovoxel/render/face_generator.h"

isovoxel::Scene VoxelEngine::renderScene(float lightingAngle) const {
    const double t0 = isovoxel::nowMs();
    isovoxel::Scene scene = isovoxel::composeScene(store_, isovoxel::wrapAngleDegrees(lightingAngle));
    lastComposeMs = static_cast<float>(isovoxel::nowMs() - t0);
    lastSceneFaceCount = static_cast<std::uint32_t>(scene.faces.size());
    return scene;
}

std::string VoxelEngine::renderSvg(float lightingAngle, bool optimize) const {
    const std::string svg = isovoxel::writeSvg(renderScene(lightingAngle));
    return optimize ? isovoxel::optimizeSvg(svg) : svg;
}

RenderInput VoxelEngine::captureRenderInput() const {
    return RenderInput{store_.voxels(), lightingAngle_};
}
