#pragma once

#include "snake_dep.h"

// ===== SNAKE GAME COLOR THEME =====
// Centralized color definitions for consistency across the snake game

namespace SnakeTheme {

// Basic color palette
namespace Colors {
    constexpr RGBColor RED(1.0f, 0.0f, 0.0f);
    constexpr RGBColor GREEN(0.0f, 1.0f, 0.0f);
    constexpr RGBColor YELLOW(1.0f, 1.0f, 0.0f);
    constexpr RGBColor WHITE(1.0f, 1.0f, 1.0f);
    constexpr RGBColor BLACK(0.0f, 0.0f, 0.0f);
    constexpr RGBColor GRAY(0.5f, 0.5f, 0.5f);
    constexpr RGBColor LIGHT_GRAY(0.8f, 0.8f, 0.8f);
    constexpr RGBColor DARK_GRAY(0.1f, 0.1f, 0.1f);
    constexpr RGBColor ORANGE(1.0f, 0.5f, 0.0f);
}

// Game entity colors
namespace GameColors {
    constexpr RGBColor SNAKE = Colors::GREEN;
    constexpr RGBColor FOOD = Colors::RED;
    constexpr RGBColor BACKGROUND = Colors::DARK_GRAY;
}

// UI and state colors
namespace UIColors {
    constexpr RGBColor TEXT_PRIMARY = Colors::WHITE;
    constexpr RGBColor TEXT_SECONDARY = Colors::LIGHT_GRAY;
    constexpr RGBColor TEXT_BEST = Colors::YELLOW;

    // Banner backgrounds
    constexpr RGBColor BANNER_LOST_BG(0.3f, 0.1f, 0.1f);   // Dark red
    constexpr RGBColor BANNER_WON_BG(0.1f, 0.3f, 0.1f);    // Dark green
    constexpr RGBColor BANNER_PAUSED_BG(0.1f, 0.1f, 0.3f); // Dark blue
}

// State-based colors (game states)
namespace StateColors {
    // Border states
    constexpr RGBColor BORDER_NORMAL = Colors::GRAY;
    constexpr RGBColor BORDER_PAUSED = Colors::ORANGE;
    constexpr RGBColor BORDER_LOST = Colors::RED;  // Flashing red after a crash
    constexpr RGBColor BORDER_WON = Colors::GREEN;

    // Snake intensity values (for multiplying with colors)
    constexpr float SNAKE_HEAD_INTENSITY = 1.0f;
    constexpr float SNAKE_BODY_INTENSITY = 0.6f;
    constexpr float SNAKE_LOST_INTENSITY = 0.35f;  // Whole snake dims after a crash
}

} // namespace SnakeTheme
