#pragma once

#include <glad/gl.h>
#ifdef __APPLE__
#include <SDL.h>
#else
#include <SDL2/SDL.h>
#endif
#include <cstdint>

#include "snake_types.h"

// RGB Color structure (inherits from fx3)
struct RGBColor : fx3 {
    constexpr RGBColor(float red = 0.f, float green = 0.f, float blue = 0.f) : fx3(red, green, blue) {}

    // Allow conversion from fx3 and enable fx3 operators
    constexpr RGBColor(const fx3& other) : fx3(other) {}
};
