#pragma once

#include "snake_dep.h"
#include "snake_draw.h"
#include "snake_app.h"
#include "snake_core.h"

// Number of draw rows above the field reserved for the score header
constexpr int UI_HEADER_ROWS = 2;

class SnakeUI {
public:
    SnakeUI(SnakeApp* app);

    // Border, header and state banners around the playing field
    void renderUI(const CoreSnapshot& snapshot, int bestScore, bool paused);

    // Drawing context for the whole window (field, border and header)
    SnakeDraw::DrawContext getDrawContext() const;

private:
    void drawScores(int score, int bestScore);
    void drawBorder(GameState state, bool paused);
    void drawBanner(GameState state, bool paused);

    SnakeApp* m_app;

    // Draw grid dimensions (field plus border and header)
    int m_gridWidth;
    int m_gridHeight;
};
