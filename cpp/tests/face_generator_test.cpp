#include <gtest/gtest.h>
#include "isovoxel/render/face_generator.h"
#include "isovoxel/render/projection.h"
#include "isovoxel/color/color_math.h"

#include <cmath>
#include <limits>

using namespace isovoxel;

TEST(FaceGeneratorTest, WrapAngleIntoZeroToThreeSixty) {
    EXPECT_FLOAT_EQ(wrapAngleDegrees(45.0f), 45.0f);
    EXPECT_FLOAT_EQ(wrapAngleDegrees(360.0f), 0.0f);
    EXPECT_FLOAT_EQ(wrapAngleDegrees(375.0f), 15.0f);
    EXPECT_FLOAT_EQ(wrapAngleDegrees(-15.0f), 345.0f);
    EXPECT_FLOAT_EQ(wrapAngleDegrees(-720.0f), 0.0f);
    EXPECT_FLOAT_EQ(wrapAngleDegrees(std::numeric_limits<float>::quiet_NaN()), 0.0f);
}

TEST(FaceGeneratorTest, LightingOffsetsAtFortyFive) {
    EXPECT_DOUBLE_EQ(faceLightingOffset(FaceKind::Top, 45.0f), 0.0);
    EXPECT_NEAR(faceLightingOffset(FaceKind::Left, 45.0f), -12.9289, 1e-3);
    EXPECT_NEAR(faceLightingOffset(FaceKind::Right, 45.0f), -22.9289, 1e-3);
}

TEST(FaceGeneratorTest, LightingOffsetsStayWithinStylizedRange) {
    for (int deg = 0; deg < 360; deg += 15) {
        const float a = static_cast<float>(deg);
        const double left = faceLightingOffset(FaceKind::Left, a);
        const double right = faceLightingOffset(FaceKind::Right, a);
        EXPECT_GE(left, -30.0 - 1e-9);
        EXPECT_LE(left, -10.0 + 1e-9);
        EXPECT_GE(right, -40.0 - 1e-9);
        EXPECT_LE(right, -20.0 + 1e-9);
        EXPECT_DOUBLE_EQ(faceLightingOffset(FaceKind::Top, a), 0.0);
    }
}

TEST(FaceGeneratorTest, OffsetIsPeriodicInAngle) {
    EXPECT_NEAR(faceLightingOffset(FaceKind::Left, 30.0f), faceLightingOffset(FaceKind::Left, 390.0f), 1e-9);
    EXPECT_NEAR(faceLightingOffset(FaceKind::Right, -90.0f), faceLightingOffset(FaceKind::Right, 270.0f), 1e-9);
}

TEST(FaceGeneratorTest, BlueVoxelFillsAtFortyFive) {
    const Voxel v{0, 0, 1, Color{0x3B, 0x82, 0xF6}};
    EXPECT_EQ(toHex(buildVoxelFace(v, FaceKind::Top, 45.0f).fill), "#3b82f6");
    EXPECT_EQ(toHex(buildVoxelFace(v, FaceKind::Left, 45.0f).fill), "#2e75e9");
    EXPECT_EQ(toHex(buildVoxelFace(v, FaceKind::Right, 45.0f).fill), "#246bdf");
}

TEST(FaceGeneratorTest, TopFaceSitsAtVoxelHeight) {
    const Voxel v{2, 3, 4, Color{1, 2, 3}};
    const Face top = buildVoxelFace(v, FaceKind::Top, 0.0f);
    EXPECT_EQ(top.kind, FaceKind::Top);
    EXPECT_EQ(top.polygon[0], project(2.0, 3.0, 4.0));
    EXPECT_EQ(top.polygon[1], project(3.0, 3.0, 4.0));
    EXPECT_EQ(top.polygon[2], project(3.0, 4.0, 4.0));
    EXPECT_EQ(top.polygon[3], project(2.0, 4.0, 4.0));
}

TEST(FaceGeneratorTest, SideFacesSpanGroundToTop) {
    const Voxel v{2, 3, 4, Color{1, 2, 3}};

    const Face left = buildVoxelFace(v, FaceKind::Left, 0.0f);
    EXPECT_EQ(left.polygon[0], project(2.0, 3.0, 4.0));
    EXPECT_EQ(left.polygon[1], project(2.0, 4.0, 4.0));
    EXPECT_EQ(left.polygon[2], project(2.0, 4.0, 0.0));
    EXPECT_EQ(left.polygon[3], project(2.0, 3.0, 0.0));

    const Face right = buildVoxelFace(v, FaceKind::Right, 0.0f);
    EXPECT_EQ(right.polygon[0], project(3.0, 3.0, 4.0));
    EXPECT_EQ(right.polygon[1], project(3.0, 4.0, 4.0));
    EXPECT_EQ(right.polygon[2], project(3.0, 4.0, 0.0));
    EXPECT_EQ(right.polygon[3], project(3.0, 3.0, 0.0));
}

TEST(FaceGeneratorTest, SideFacesAreDarkerThanTop) {
    const Voxel v{0, 0, 1, Color{200, 200, 200}};
    for (int deg = 0; deg < 360; deg += 45) {
        const float a = static_cast<float>(deg);
        const Color top = buildVoxelFace(v, FaceKind::Top, a).fill;
        EXPECT_LT(buildVoxelFace(v, FaceKind::Left, a).fill.r, top.r);
        EXPECT_LT(buildVoxelFace(v, FaceKind::Right, a).fill.r, top.r);
    }
}

// At these angles the offset lands just past a whole number (-35.000000000000007,
// -30.000000000000004, -25.00000000000001); the channel must truncate one lower.
TEST(FaceGeneratorTest, OffsetsJustBelowIntegersTruncateDown) {
    const Voxel blue{0, 0, 1, Color{0x3B, 0x82, 0xF6}};
    EXPECT_LT(faceLightingOffset(FaceKind::Right, 240.0f), -35.0);
    EXPECT_EQ(buildVoxelFace(blue, FaceKind::Right, 240.0f).fill.r, 23);
    EXPECT_EQ(buildVoxelFace(blue, FaceKind::Right, 240.0f).fill.b, 211);

    EXPECT_LT(faceLightingOffset(FaceKind::Right, 270.0f), -30.0);
    EXPECT_EQ(buildVoxelFace(blue, FaceKind::Right, 270.0f).fill.r, 28);

    const Voxel grey{0, 0, 1, Color{40, 40, 40}};
    EXPECT_LT(faceLightingOffset(FaceKind::Left, 330.0f), -25.0);
    EXPECT_EQ(buildVoxelFace(grey, FaceKind::Left, 330.0f).fill, (Color{14, 14, 14}));
}

TEST(FaceGeneratorTest, KeyboardAnglesMatchDirectBrightnessShift) {
    const Voxel slate{0, 0, 1, Color{0x47, 0x55, 0x69}};
    for (int deg = 0; deg < 360; deg += 15) {
        const float a = static_cast<float>(deg);
        for (const FaceKind kind : {FaceKind::Top, FaceKind::Left, FaceKind::Right}) {
            EXPECT_EQ(buildVoxelFace(slate, kind, a).fill, adjustBrightness(slate.color, faceLightingOffset(kind, a)))
                << "angle " << deg;
        }
    }
}
