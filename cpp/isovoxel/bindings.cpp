#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

// Include the engine public API header for bindings.
#include "isovoxel/engine.h"
#include "isovoxel/interaction/interaction_session.h"
#include "isovoxel/color/color_math.h"

#ifdef EMSCRIPTEN
namespace {

struct VoxelResult {
    std::int32_t x, y, height;
    std::string color;
    bool valid;
};

// Flattened face for JS consumers; polygon corners in order.
struct FaceResult {
    std::uint32_t kind;
    float x0, y0, x1, y1, x2, y2, x3, y3;
    std::string fill;
};

struct SceneResult {
    float viewX, viewY, viewWidth, viewHeight;
    std::string stroke;
    float strokeWidth;
    std::vector<FaceResult> faces;
};

SceneResult toSceneResult(const isovoxel::Scene& scene) {
    SceneResult out{};
    out.viewX = scene.viewport.x;
    out.viewY = scene.viewport.y;
    out.viewWidth = scene.viewport.width;
    out.viewHeight = scene.viewport.height;
    out.stroke = isovoxel::toHex(scene.stroke.color);
    out.strokeWidth = scene.stroke.widthPx;
    out.faces.reserve(scene.faces.size());
    for (const auto& f : scene.faces) {
        out.faces.push_back(FaceResult{
            static_cast<std::uint32_t>(f.kind),
            f.polygon[0].x, f.polygon[0].y,
            f.polygon[1].x, f.polygon[1].y,
            f.polygon[2].x, f.polygon[2].y,
            f.polygon[3].x, f.polygon[3].y,
            isovoxel::toHex(f.fill),
        });
    }
    return out;
}

} // namespace

EMSCRIPTEN_BINDINGS(isovoxel_engine_module) {
    emscripten::enum_<EngineError>("EngineError")
        .value("Ok", EngineError::Ok)
        .value("InvalidCoordinate", EngineError::InvalidCoordinate)
        .value("InvalidHeight", EngineError::InvalidHeight)
        .value("InvalidColor", EngineError::InvalidColor)
        .value("InvalidOperation", EngineError::InvalidOperation);

    emscripten::enum_<StrokeMode>("StrokeMode")
        .value("None", StrokeMode::None)
        .value("Paint", StrokeMode::Paint)
        .value("Erase", StrokeMode::Erase);

    emscripten::class_<VoxelEngine>("VoxelEngine")
        .constructor<>()
        .function("reset", &VoxelEngine::reset)
        .function("upsertVoxel", emscripten::optional_override([](VoxelEngine& self, std::int32_t x, std::int32_t y, std::int32_t height, const std::string& color) {
            return self.upsertVoxel(x, y, height, std::string_view(color));
        }))
        .function("removeVoxel", &VoxelEngine::removeVoxel)
        .function("clear", &VoxelEngine::clear)
        .function("paintCell", &VoxelEngine::paintCell)
        .function("undo", &VoxelEngine::undo)
        .function("redo", &VoxelEngine::redo)
        .function("canUndo", &VoxelEngine::canUndo)
        .function("canRedo", &VoxelEngine::canRedo)
        .function("getHistoryMeta", &VoxelEngine::getHistoryMeta)
        .function("hasVoxel", &VoxelEngine::hasVoxel)
        .function("getVoxel", emscripten::optional_override([](const VoxelEngine& self, std::int32_t x, std::int32_t y) {
            const auto v = self.getVoxel(x, y);
            if (!v) return VoxelResult{x, y, 0, std::string{}, false};
            return VoxelResult{v->x, v->y, v->height, isovoxel::toHex(v->color), true};
        }))
        .function("getVoxelCount", emscripten::optional_override([](const VoxelEngine& self) {
            return static_cast<std::uint32_t>(self.getVoxelCount());
        }))
        .function("setBrushColor", emscripten::optional_override([](VoxelEngine& self, const std::string& color) {
            return self.setBrushColor(std::string_view(color));
        }))
        .function("getBrushColor", emscripten::optional_override([](const VoxelEngine& self) {
            return isovoxel::toHex(self.getBrushColor());
        }))
        .function("selectPaletteColor", &VoxelEngine::selectPaletteColor)
        .function("setBrushHeight", &VoxelEngine::setBrushHeight)
        .function("getBrushHeight", &VoxelEngine::getBrushHeight)
        .function("setLightingAngle", &VoxelEngine::setLightingAngle)
        .function("stepLightingAngle", &VoxelEngine::stepLightingAngle)
        .function("stepBrushHeight", &VoxelEngine::stepBrushHeight)
        .function("getLightingAngle", &VoxelEngine::getLightingAngle)
        .function("renderScene", emscripten::optional_override([](const VoxelEngine& self, float lightingAngle) {
            return toSceneResult(self.renderScene(lightingAngle));
        }))
        .function("renderSvg", &VoxelEngine::renderSvg)
        .function("getDocumentDigest", &VoxelEngine::getDocumentDigest)
        .function("getStats", &VoxelEngine::getStats)
        .function("getLastError", &VoxelEngine::getLastError)
        .function("getGeneration", &VoxelEngine::getGeneration);

    emscripten::class_<InteractionSession>("InteractionSession")
        .constructor<VoxelEngine&>()
        .function("beginStroke", &InteractionSession::beginStroke)
        .function("continueStroke", &InteractionSession::continueStroke)
        .function("endStroke", &InteractionSession::endStroke)
        .function("isStrokeActive", &InteractionSession::isStrokeActive);

    emscripten::value_object<VoxelResult>("VoxelResult")
        .field("x", &VoxelResult::x)
        .field("y", &VoxelResult::y)
        .field("height", &VoxelResult::height)
        .field("color", &VoxelResult::color)
        .field("valid", &VoxelResult::valid);

    emscripten::value_object<FaceResult>("FaceResult")
        .field("kind", &FaceResult::kind)
        .field("x0", &FaceResult::x0)
        .field("y0", &FaceResult::y0)
        .field("x1", &FaceResult::x1)
        .field("y1", &FaceResult::y1)
        .field("x2", &FaceResult::x2)
        .field("y2", &FaceResult::y2)
        .field("x3", &FaceResult::x3)
        .field("y3", &FaceResult::y3)
        .field("fill", &FaceResult::fill);

    emscripten::value_object<SceneResult>("SceneResult")
        .field("viewX", &SceneResult::viewX)
        .field("viewY", &SceneResult::viewY)
        .field("viewWidth", &SceneResult::viewWidth)
        .field("viewHeight", &SceneResult::viewHeight)
        .field("stroke", &SceneResult::stroke)
        .field("strokeWidth", &SceneResult::strokeWidth)
        .field("faces", &SceneResult::faces);

    emscripten::value_object<VoxelEngine::HistoryMeta>("HistoryMeta")
        .field("depth", &VoxelEngine::HistoryMeta::depth)
        .field("cursor", &VoxelEngine::HistoryMeta::cursor)
        .field("generation", &VoxelEngine::HistoryMeta::generation)
        .field("canUndo", &VoxelEngine::HistoryMeta::canUndo)
        .field("canRedo", &VoxelEngine::HistoryMeta::canRedo);

    emscripten::value_object<VoxelEngine::DocumentDigest>("DocumentDigest")
        .field("lo", &VoxelEngine::DocumentDigest::lo)
        .field("hi", &VoxelEngine::DocumentDigest::hi);

    emscripten::value_object<VoxelEngine::EngineStats>("EngineStats")
        .field("generation", &VoxelEngine::EngineStats::generation)
        .field("voxelCount", &VoxelEngine::EngineStats::voxelCount)
        .field("historyDepth", &VoxelEngine::EngineStats::historyDepth)
        .field("lastSceneFaceCount", &VoxelEngine::EngineStats::lastSceneFaceCount)
        .field("lastComposeMs", &VoxelEngine::EngineStats::lastComposeMs)
        .field("lastApplyMs", &VoxelEngine::EngineStats::lastApplyMs);

    emscripten::register_vector<FaceResult>("VectorFaceResult");
}
#endif
