#pragma once

#include <cstdint>

enum class StrokeMode : std::uint8_t {
    None = 0,
    Paint = 1,
    Erase = 2
};
