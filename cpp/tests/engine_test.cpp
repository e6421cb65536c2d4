#include <gtest/gtest.h>
#include "isovoxel/engine.h"
#include "isovoxel/color/color_math.h"
#include "tests/test_accessors.h"

#include <string>

class VoxelEngineTest : public ::testing::Test {
protected:
    VoxelEngine engine;
};

TEST_F(VoxelEngineTest, DefaultsOnConstruction) {
    EXPECT_EQ(engine.getVoxelCount(), 0u);
    EXPECT_EQ(engine.getBrushColor(), kDefaultBrushColor);
    EXPECT_EQ(engine.getBrushHeight(), 1);
    EXPECT_FLOAT_EQ(engine.getLightingAngle(), 45.0f);
    EXPECT_FALSE(engine.canUndo());
    EXPECT_FALSE(engine.canRedo());
    EXPECT_EQ(engine.getLastError(), EngineError::Ok);
}

TEST_F(VoxelEngineTest, UpsertStoresExactValues) {
    ASSERT_EQ(engine.upsertVoxel(3, 4, 5, "#10B981"), EngineError::Ok);
    const auto v = engine.getVoxel(3, 4);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->height, 5);
    EXPECT_EQ(isovoxel::toHex(v->color), "#10b981");
    EXPECT_TRUE(engine.hasVoxel(3, 4));
    EXPECT_EQ(engine.getHistoryMeta().depth, 1u);
}

TEST_F(VoxelEngineTest, RejectedUpsertLeavesStoreAndHistoryUnchanged) {
    ASSERT_EQ(engine.upsertVoxel(0, 0, 2, "#3B82F6"), EngineError::Ok);
    const auto digest = engine.getDocumentDigest();
    const auto gen = engine.getGeneration();

    EXPECT_EQ(engine.upsertVoxel(20, 0, 2, "#3B82F6"), EngineError::InvalidCoordinate);
    EXPECT_EQ(engine.getLastError(), EngineError::InvalidCoordinate);
    EXPECT_EQ(engine.upsertVoxel(0, 0, 11, "#3B82F6"), EngineError::InvalidHeight);
    EXPECT_EQ(engine.upsertVoxel(0, 0, 3, "blue"), EngineError::InvalidColor);
    EXPECT_EQ(VoxelEngineTestAccessor::lastError(engine), EngineError::InvalidColor);

    EXPECT_EQ(engine.getHistoryMeta().depth, 1u);
    EXPECT_EQ(engine.getGeneration(), gen);
    EXPECT_EQ(engine.getDocumentDigest().lo, digest.lo);
    EXPECT_EQ(engine.getDocumentDigest().hi, digest.hi);
    EXPECT_EQ(engine.getVoxel(0, 0)->height, 2);

    ASSERT_EQ(engine.upsertVoxel(1, 1, 1, "#3B82F6"), EngineError::Ok);
    EXPECT_EQ(engine.getLastError(), EngineError::Ok);
}

TEST_F(VoxelEngineTest, CoordinateErrorWinsOverBadColor) {
    EXPECT_EQ(engine.upsertVoxel(-1, 0, 1, "zzz"), EngineError::InvalidCoordinate);
    EXPECT_EQ(engine.upsertVoxel(0, 0, 0, "zzz"), EngineError::InvalidHeight);
}

TEST_F(VoxelEngineTest, UpsertAlwaysRecordsEvenWhenUnchanged) {
    ASSERT_EQ(engine.upsertVoxel(2, 2, 2, "#8B5CF6"), EngineError::Ok);
    ASSERT_EQ(engine.upsertVoxel(2, 2, 2, "#8B5CF6"), EngineError::Ok);
    EXPECT_EQ(engine.getHistoryMeta().depth, 2u);
}

TEST_F(VoxelEngineTest, RemoveRecordsOnlyWhenSomethingWasRemoved) {
    EXPECT_FALSE(engine.removeVoxel(5, 5));
    EXPECT_EQ(engine.getHistoryMeta().depth, 0u);

    ASSERT_EQ(engine.upsertVoxel(5, 5, 1, "#F59E0B"), EngineError::Ok);
    EXPECT_TRUE(engine.removeVoxel(5, 5));
    EXPECT_EQ(engine.getHistoryMeta().depth, 2u);
    EXPECT_FALSE(engine.hasVoxel(5, 5));
    EXPECT_FALSE(engine.removeVoxel(99, 99));
}

TEST_F(VoxelEngineTest, ClearAlwaysRecordsAndIsIdempotent) {
    engine.clear();
    EXPECT_EQ(engine.getVoxelCount(), 0u);
    EXPECT_EQ(engine.getHistoryMeta().depth, 1u);

    ASSERT_EQ(engine.upsertVoxel(1, 2, 3, "#14B8A6"), EngineError::Ok);
    engine.clear();
    engine.clear();
    EXPECT_EQ(engine.getVoxelCount(), 0u);
    EXPECT_EQ(engine.getHistoryMeta().depth, 4u);

    // Undo the second clear: still empty. Undo the first: voxel is back.
    engine.undo();
    EXPECT_EQ(engine.getVoxelCount(), 0u);
    engine.undo();
    EXPECT_TRUE(engine.hasVoxel(1, 2));
}

TEST_F(VoxelEngineTest, UndoRedoThroughEngine) {
    ASSERT_EQ(engine.upsertVoxel(0, 0, 1, "#3B82F6"), EngineError::Ok);
    ASSERT_EQ(engine.upsertVoxel(1, 0, 2, "#3B82F6"), EngineError::Ok);
    ASSERT_EQ(engine.upsertVoxel(2, 0, 3, "#3B82F6"), EngineError::Ok);

    engine.undo();
    engine.undo();
    EXPECT_EQ(engine.getVoxelCount(), 1u);
    EXPECT_FALSE(engine.canUndo());
    EXPECT_TRUE(engine.canRedo());

    ASSERT_EQ(engine.upsertVoxel(9, 9, 9, "#475569"), EngineError::Ok);
    const auto before = engine.getVoxels();
    engine.redo();
    EXPECT_EQ(engine.getVoxels(), before);
    EXPECT_FALSE(engine.hasVoxel(2, 0));
}

TEST_F(VoxelEngineTest, UnavailableUndoRedoDoNotBumpGeneration) {
    const auto gen = engine.getGeneration();
    engine.undo();
    engine.redo();
    EXPECT_EQ(engine.getGeneration(), gen);
}

TEST_F(VoxelEngineTest, PaintCellUsesBrush) {
    ASSERT_EQ(engine.selectPaletteColor(3), EngineError::Ok);
    ASSERT_EQ(engine.setBrushHeight(7), EngineError::Ok);
    ASSERT_EQ(engine.paintCell(6, 6), EngineError::Ok);

    const auto v = engine.getVoxel(6, 6);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->height, 7);
    EXPECT_EQ(isovoxel::toHex(v->color), "#10b981");

    EXPECT_EQ(engine.paintCell(-1, 6), EngineError::InvalidCoordinate);
}

TEST_F(VoxelEngineTest, BrushSettersValidate) {
    EXPECT_EQ(engine.setBrushHeight(0), EngineError::InvalidHeight);
    EXPECT_EQ(engine.setBrushHeight(11), EngineError::InvalidHeight);
    EXPECT_EQ(engine.getBrushHeight(), 1);

    EXPECT_EQ(engine.setBrushColor("#12"), EngineError::InvalidColor);
    EXPECT_EQ(engine.getBrushColor(), kDefaultBrushColor);
    ASSERT_EQ(engine.setBrushColor("#8b5cf6"), EngineError::Ok);
    EXPECT_EQ(isovoxel::toHex(engine.getBrushColor()), "#8b5cf6");

    EXPECT_EQ(engine.selectPaletteColor(0), EngineError::InvalidOperation);
    EXPECT_EQ(engine.selectPaletteColor(7), EngineError::InvalidOperation);
    EXPECT_EQ(engine.getLastError(), EngineError::InvalidOperation);
}

TEST_F(VoxelEngineTest, BrushHeightStepsAndClamps) {
    engine.stepBrushHeight(-1);
    EXPECT_EQ(engine.getBrushHeight(), kMinVoxelHeight);

    for (int i = 0; i < 12; ++i) engine.stepBrushHeight(1);
    EXPECT_EQ(engine.getBrushHeight(), kMaxVoxelHeight);

    engine.stepBrushHeight(-3);
    EXPECT_EQ(engine.getBrushHeight(), 7);
    engine.stepBrushHeight(-100);
    EXPECT_EQ(engine.getBrushHeight(), kMinVoxelHeight);

    engine.stepBrushHeight(2);
    ASSERT_EQ(engine.paintCell(0, 0), EngineError::Ok);
    EXPECT_EQ(engine.getVoxel(0, 0)->height, 3);
}

TEST_F(VoxelEngineTest, LightingAngleStepsAndWraps) {
    for (int i = 0; i < 4; ++i) engine.stepLightingAngle(-kLightingAngleStep);
    EXPECT_FLOAT_EQ(engine.getLightingAngle(), 345.0f);
    engine.stepLightingAngle(kLightingAngleStep);
    EXPECT_FLOAT_EQ(engine.getLightingAngle(), 0.0f);

    engine.setLightingAngle(725.0f);
    EXPECT_FLOAT_EQ(engine.getLightingAngle(), 5.0f);
}

TEST_F(VoxelEngineTest, RenderEmptyStoreGivesDefaultScene) {
    const isovoxel::Scene scene = engine.renderScene();
    EXPECT_TRUE(scene.empty());
    EXPECT_FLOAT_EQ(scene.viewport.width, 400.0f);
    EXPECT_FLOAT_EQ(scene.viewport.height, 400.0f);
    EXPECT_EQ(engine.renderSvg(45.0f, false), "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"0 0 400 400\"></svg>");
}

TEST_F(VoxelEngineTest, RenderDoesNotMutate) {
    ASSERT_EQ(engine.upsertVoxel(0, 0, 1, "#3B82F6"), EngineError::Ok);
    const auto digest = engine.getDocumentDigest();
    const auto depth = engine.getHistoryMeta().depth;

    const isovoxel::Scene scene = engine.renderScene(45.0f);
    ASSERT_EQ(scene.faces.size(), 3u);
    EXPECT_EQ(isovoxel::toHex(scene.faces[0].fill), "#246bdf");
    EXPECT_EQ(isovoxel::toHex(scene.faces[1].fill), "#2e75e9");
    EXPECT_EQ(isovoxel::toHex(scene.faces[2].fill), "#3b82f6");

    EXPECT_EQ(engine.getDocumentDigest().lo, digest.lo);
    EXPECT_EQ(engine.getHistoryMeta().depth, depth);
    EXPECT_EQ(engine.getStats().lastSceneFaceCount, 3u);
}

TEST_F(VoxelEngineTest, RenderWrapsOutOfRangeAngle) {
    ASSERT_EQ(engine.upsertVoxel(4, 4, 4, "#F59E0B"), EngineError::Ok);
    const auto a = engine.renderScene(45.0f);
    const auto b = engine.renderScene(405.0f);
    EXPECT_EQ(a.faces, b.faces);
}

TEST_F(VoxelEngineTest, CapturedRenderInputIsDetached) {
    ASSERT_EQ(engine.upsertVoxel(1, 1, 2, "#3B82F6"), EngineError::Ok);
    engine.setLightingAngle(90.0f);
    const RenderInput input = engine.captureRenderInput();

    ASSERT_EQ(engine.upsertVoxel(2, 2, 2, "#3B82F6"), EngineError::Ok);
    engine.setLightingAngle(10.0f);

    ASSERT_EQ(input.voxels.size(), 1u);
    EXPECT_EQ(input.voxels[0].x, 1);
    EXPECT_FLOAT_EQ(input.lightingAngle, 90.0f);
}

TEST_F(VoxelEngineTest, StatsTrackEdits) {
    ASSERT_EQ(engine.upsertVoxel(0, 0, 1, "#3B82F6"), EngineError::Ok);
    ASSERT_EQ(engine.upsertVoxel(0, 1, 1, "#3B82F6"), EngineError::Ok);
    const auto stats = engine.getStats();
    EXPECT_EQ(stats.voxelCount, 2u);
    EXPECT_EQ(stats.historyDepth, 2u);
    EXPECT_EQ(stats.generation, engine.getGeneration());
    EXPECT_GE(VoxelEngineTestAccessor::lastApplyMs(engine), 0.0f);
}

TEST_F(VoxelEngineTest, ResetRestoresDefaults) {
    ASSERT_EQ(engine.upsertVoxel(0, 0, 1, "#3B82F6"), EngineError::Ok);
    ASSERT_EQ(engine.upsertVoxel(0, 1, 1, "#3B82F6"), EngineError::Ok);
    ASSERT_EQ(engine.setBrushHeight(9), EngineError::Ok);
    engine.setLightingAngle(200.0f);

    engine.reset();
    EXPECT_EQ(engine.getVoxelCount(), 0u);
    EXPECT_EQ(engine.getHistoryMeta().depth, 0u);
    EXPECT_EQ(engine.getBrushHeight(), kDefaultBrushHeight);
    EXPECT_FLOAT_EQ(engine.getLightingAngle(), kDefaultLightingAngle);
    EXPECT_FALSE(engine.canUndo());
    EXPECT_TRUE(VoxelEngineTestAccessor::store(engine).empty());
    EXPECT_EQ(VoxelEngineTestAccessor::history(engine).getIndex(), -1);
}

TEST_F(VoxelEngineTest, SixtyEditsKeepUndoAvailable) {
    for (std::int32_t i = 0; i < 60; ++i) {
        ASSERT_EQ(engine.upsertVoxel(i % kGridSize, i / kGridSize, 1, "#3B82F6"), EngineError::Ok);
    }
    EXPECT_LE(engine.getHistoryMeta().depth, 50u);
    EXPECT_TRUE(engine.canUndo());
}
