#include "snake_ui.h"
#include "snake_theme.h" // Centralized color theme
#include <cstdio>
#include <iostream>

// Use centralized color theme
using namespace SnakeTheme;

SnakeUI::SnakeUI(SnakeApp* app) : m_app(app) {
    // One border cell on each side, header rows on top
    m_gridWidth = m_app->getConfig().gridWidth + 2;
    m_gridHeight = m_app->getConfig().gridHeight + 2 + UI_HEADER_ROWS;

    std::cout << "🎨 UI system initialized" << std::endl;
}

SnakeDraw::DrawContext SnakeUI::getDrawContext() const {
    return SnakeDraw::DrawContext(m_gridWidth, m_gridHeight,
                                  m_app->getOffsetUniform(), m_app->getColorUniform(),
                                  m_app->getScaleUniform(), m_app->getShapeTypeUniform(),
                                  m_app->getTextureUniform(), m_app->getUseTextureUniform());
}

void SnakeUI::renderUI(const CoreSnapshot& snapshot, int bestScore, bool paused) {
    drawScores(snapshot.score, bestScore);
    drawBorder(snapshot.state, paused);
    // Banners go last so they sit on top of the field
    drawBanner(snapshot.state, paused);
}

void SnakeUI::drawScores(int score, int bestScore) {
    auto ctx = getDrawContext();

    float cellWidth = ctx.cellWidth();
    float cellHeight = ctx.cellHeight();
    float aspect = cellWidth / cellHeight;
    float textSize = cellHeight * 0.8f;
    float textY = ((m_gridHeight - UI_HEADER_ROWS) * cellHeight) - 1.0f + cellHeight * 0.6f;

    char scoreText[32];
    snprintf(scoreText, sizeof(scoreText), "SCORE %d", score);
    SnakeDraw::drawText(scoreText, cellWidth - 1.0f, textY, textSize, UIColors::TEXT_PRIMARY, ctx);

    char bestText[32];
    snprintf(bestText, sizeof(bestText), "BEST %d", bestScore);
    float bestX = 1.0f - cellWidth - SnakeDraw::textWidth(bestText, textSize) * aspect;
    SnakeDraw::drawText(bestText, bestX, textY, textSize, UIColors::TEXT_BEST, ctx);
}

void SnakeUI::drawBorder(GameState state, bool paused) {
    float currentTime = m_app->getCurrentTime();
    const float FLASH_INTERVAL = 0.25f;
    RGBColor borderColor;

    if (state == GameState::LOST) {
        bool showRed = ((int)(currentTime / FLASH_INTERVAL) % 2) == 0;
        borderColor = showRed ? StateColors::BORDER_LOST : StateColors::BORDER_NORMAL;
    } else if (state == GameState::WON) {
        borderColor = StateColors::BORDER_WON;
    } else if (paused) {
        borderColor = StateColors::BORDER_PAUSED;
    } else {
        borderColor = StateColors::BORDER_NORMAL;
    }

    auto ctx = getDrawContext();
    int top = m_gridHeight - UI_HEADER_ROWS - 1;
    for (int x = 0; x < m_gridWidth; x++) {
        SnakeDraw::drawSquare(x, 0, borderColor, ctx); // Bottom
        SnakeDraw::drawSquare(x, top, borderColor, ctx); // Top
    }
    for (int y = 0; y <= top; y++) {
        SnakeDraw::drawSquare(0, y, borderColor, ctx); // Left
        SnakeDraw::drawSquare(m_gridWidth - 1, y, borderColor, ctx); // Right
    }
}

void SnakeUI::drawBanner(GameState state, bool paused) {
    auto ctx = getDrawContext();

    if (state == GameState::LOST) {
        SnakeDraw::drawBanner("GAME OVER", "ENTER TO RESTART", UIColors::BANNER_LOST_BG,
                              UIColors::TEXT_PRIMARY, ctx);
    } else if (state == GameState::WON) {
        SnakeDraw::drawBanner("YOU WIN", "ENTER TO RESTART", UIColors::BANNER_WON_BG,
                              UIColors::TEXT_PRIMARY, ctx);
    } else if (paused) {
        SnakeDraw::drawBanner("PAUSED", nullptr, UIColors::BANNER_PAUSED_BG,
                              UIColors::TEXT_SECONDARY, ctx);
    }
}
