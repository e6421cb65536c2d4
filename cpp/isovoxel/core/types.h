#ifndef ISOVOXEL_CORE_TYPES_H
#define ISOVOXEL_CORE_TYPES_H

#include <cstdint>
#include <cstddef>

// Lightweight types and constants used by the voxel engine.

// Grid extent and edit bounds
static constexpr std::int32_t kGridSize = 20;
static constexpr std::size_t kGridCellCount = static_cast<std::size_t>(kGridSize) * kGridSize;
static constexpr std::int32_t kMinVoxelHeight = 1;
static constexpr std::int32_t kMaxVoxelHeight = 10;

// History
static constexpr std::size_t kMaxHistoryEntries = 50;

// Projection / scene composition
static constexpr double kIsoAngleRad = 3.14159265358979323846 / 6.0; // 30 degrees
static constexpr double kIsoScale = 20.0;
static constexpr std::int32_t kSortRowStride = 100; // order = y + x * stride; valid while kGridSize < stride
static constexpr float kViewportPadding = 40.0f;
static constexpr float kDefaultViewportSize = 400.0f;
static constexpr float kFaceStrokeWidthPx = 0.5f;

// Editor defaults
static constexpr float kDefaultLightingAngle = 45.0f;
static constexpr float kLightingAngleStep = 15.0f;
static constexpr std::int32_t kDefaultBrushHeight = 1;

static_assert(kGridSize < kSortRowStride, "painter sort key requires grid extent below the row stride");

struct Point2 { float x; float y; };

inline bool operator==(const Point2& a, const Point2& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point2& a, const Point2& b) { return !(a == b); }

// Validated 8-bit RGB color. Built through isovoxel::parseColor / adjustBrightness,
// never from unchecked strings.
struct Color {
    std::uint8_t r;
    std::uint8_t g;
    std::uint8_t b;
};

inline bool operator==(const Color& a, const Color& b) { return a.r == b.r && a.g == b.g && a.b == b.b; }
inline bool operator!=(const Color& a, const Color& b) { return !(a == b); }

static constexpr Color kDefaultBrushColor{0x3B, 0x82, 0xF6};
static constexpr Color kFaceStrokeColor{0x1E, 0x29, 0x3B};

struct Voxel {
    std::int32_t x;
    std::int32_t y;
    std::int32_t height;
    Color color;
};

inline bool operator==(const Voxel& a, const Voxel& b) {
    return a.x == b.x && a.y == b.y && a.height == b.height && a.color == b.color;
}
inline bool operator!=(const Voxel& a, const Voxel& b) { return !(a == b); }

inline bool isCellInGrid(std::int32_t x, std::int32_t y) noexcept {
    return x >= 0 && x < kGridSize && y >= 0 && y < kGridSize;
}

inline bool isValidHeight(std::int32_t height) noexcept {
    return height >= kMinVoxelHeight && height <= kMaxVoxelHeight;
}

// Composite dense key; callers must check isCellInGrid first.
inline std::size_t cellKey(std::int32_t x, std::int32_t y) noexcept {
    return static_cast<std::size_t>(x) * static_cast<std::size_t>(kGridSize) + static_cast<std::size_t>(y);
}

enum class EngineError : std::uint32_t {
    Ok = 0,
    InvalidCoordinate = 1,
    InvalidHeight = 2,
    InvalidColor = 3,
    InvalidOperation = 4,
};

#endif // ISOVOXEL_CORE_TYPES_H
