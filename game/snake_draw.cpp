#include "snake_draw.h"
#include "snake_dep.h"
#include <algorithm>
#include <cmath>
#include <cstring>

// External font data (from font0.cpp)
extern const bool font_5x7[36][7][5];
extern int getCharIndex(char c);

namespace SnakeDraw {

Point fieldToDraw(const Point& cell, int fieldHeight) {
    return Point(cell.x + 1, fieldHeight - cell.y);
}

void drawSquare(int x, int y, const RGBColor& color, const DrawContext& ctx) {
    float cellWidth = ctx.cellWidth();
    float cellHeight = ctx.cellHeight();
    float ndcX = (x * cellWidth) - 1.0f;
    float ndcY = (y * cellHeight) - 1.0f;

    glUniform2f(ctx.u_offset, ndcX, ndcY);
    glUniform2f(ctx.u_scale, cellWidth, cellHeight);
    glUniform3f(ctx.u_color, color.r, color.g, color.b);
    glUniform1i(ctx.u_shape_type, 0); // Rectangle
    glUniform1i(ctx.u_use_texture, GL_FALSE);
    glDrawElements(GL_TRIANGLES, 6, GL_UNSIGNED_INT, 0);
}

void drawSmallSquare(float x, float y, float size, const RGBColor& color, const DrawContext& ctx) {
    // x, y are in NDC coordinates, size is the height in NDC space
    float aspect = ctx.cellHeight() / ctx.cellWidth();
    glUniform2f(ctx.u_offset, x, y);
    glUniform2f(ctx.u_scale, size / aspect, size);
    glUniform3f(ctx.u_color, color.r, color.g, color.b);
    glUniform1i(ctx.u_shape_type, 0);
    glUniform1i(ctx.u_use_texture, GL_FALSE);
    glDrawElements(GL_TRIANGLES, 6, GL_UNSIGNED_INT, 0);
}

void drawCircle(float x, float y, float diameter, const RGBColor& color, const DrawContext& ctx) {
    // x, y are the circle center in NDC, diameter is measured along x
    float aspect = ctx.cellHeight() / ctx.cellWidth();
    float height = diameter * aspect;
    glUniform2f(ctx.u_offset, x - diameter * 0.5f, y - height * 0.5f);
    glUniform2f(ctx.u_scale, diameter, height);
    glUniform3f(ctx.u_color, color.r, color.g, color.b);
    glUniform1i(ctx.u_shape_type, 1); // Circle shape
    glUniform1i(ctx.u_use_texture, GL_FALSE);

    // Alpha blending for the anti-aliased edge
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    glDrawElements(GL_TRIANGLES, 6, GL_UNSIGNED_INT, 0);

    glDisable(GL_BLEND);
}

void drawTexturedSquare(int x, int y, GLuint texture, const DrawContext& ctx) {
    float cellWidth = ctx.cellWidth();
    float cellHeight = ctx.cellHeight();
    float ndcX = (x * cellWidth) - 1.0f;
    float ndcY = (y * cellHeight) - 1.0f;

    glUniform2f(ctx.u_offset, ndcX, ndcY);
    glUniform2f(ctx.u_scale, cellWidth, cellHeight);
    glUniform1i(ctx.u_use_texture, GL_TRUE);
    glUniform1i(ctx.u_shape_type, 3); // Texture mode

    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, texture);
    glUniform1i(ctx.u_texture, 0);

    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    glDrawElements(GL_TRIANGLES, 6, GL_UNSIGNED_INT, 0);

    glDisable(GL_BLEND);
    glUniform1i(ctx.u_use_texture, GL_FALSE);
}

// Simple character rendering using small squares (5x7 character matrix)
void drawChar(char c, float startX, float startY, float charSize, const RGBColor& color, const DrawContext& ctx) {
    int charIndex = getCharIndex(c);
    if (charIndex < 0 || charIndex >= 36) return;

    float pixelSize = charSize / 7.0f; // Each character pixel is 1/7th of character height
    float pixelWidth = pixelSize * (ctx.cellWidth() / ctx.cellHeight());
    for (int row = 0; row < 7; row++) {
        for (int col = 0; col < 5; col++) {
            if (font_5x7[charIndex][row][col]) {
                float pixelX = startX + (col * pixelWidth);
                float pixelY = startY + ((6 - row) * pixelSize);
                drawSmallSquare(pixelX, pixelY, pixelSize, color, ctx);
            }
        }
    }
}

float textWidth(const char* text, float charSize) {
    size_t count = strlen(text);
    if (count == 0) return 0.0f;
    float charWidth = charSize * (5.0f / 7.0f);
    float spacing = charSize * 0.2f;
    return count * (charWidth + spacing) - spacing;
}

void drawText(const char* text, float startX, float startY, float charSize, const RGBColor& color, const DrawContext& ctx) {
    float x = startX;
    float aspect = ctx.cellWidth() / ctx.cellHeight();
    float advance = (charSize * (5.0f / 7.0f) + charSize * 0.2f) * aspect;
    while (*text) {
        drawChar(*text, x, startY, charSize, color, ctx);
        x += advance;
        text++;
    }
}

// Round eyes on the front of the head, pupils looking toward the food
void drawSnakeEyes(const Point& head, const Point& food, bool hasFood, Point direction,
                   const DrawContext& ctx) {
    float cellWidth = ctx.cellWidth();
    float cellHeight = ctx.cellHeight();

    float headNdcX = (head.x * cellWidth) - 1.0f + (cellWidth * 0.5f);
    float headNdcY = (head.y * cellHeight) - 1.0f + (cellHeight * 0.5f);

    float moveDirX = (float)direction.x;
    float moveDirY = (float)direction.y;

    float foodDirX = 0.0f;
    float foodDirY = 0.0f;
    if (hasFood) {
        foodDirX = (float)(food.x - head.x);
        foodDirY = (float)(food.y - head.y);
        float length = std::sqrt(foodDirX * foodDirX + foodDirY * foodDirY);
        if (length > 0) {
            foodDirX /= length;
            foodDirY /= length;
        }
    }

    float eyeDiameter = cellWidth * 0.35f;
    float pupilDiameter = eyeDiameter * 0.5f;

    float eyeSpacingX = cellWidth * 0.2f;
    float eyeSpacingY = cellHeight * 0.2f;
    float frontOffsetX = cellWidth * 0.25f;
    float frontOffsetY = cellHeight * 0.25f;

    // Perpendicular of the movement direction spaces the two eyes apart
    float perpX = -moveDirY;
    float perpY = moveDirX;

    float leftEyeX = headNdcX + (moveDirX * frontOffsetX) + (perpX * eyeSpacingX);
    float leftEyeY = headNdcY + (moveDirY * frontOffsetY) + (perpY * eyeSpacingY);
    float rightEyeX = headNdcX + (moveDirX * frontOffsetX) - (perpX * eyeSpacingX);
    float rightEyeY = headNdcY + (moveDirY * frontOffsetY) - (perpY * eyeSpacingY);

    constexpr RGBColor WHITE(1.0f, 1.0f, 1.0f);
    constexpr RGBColor BLACK(0.0f, 0.0f, 0.0f);

    drawCircle(leftEyeX, leftEyeY, eyeDiameter, WHITE, ctx);
    drawCircle(rightEyeX, rightEyeY, eyeDiameter, WHITE, ctx);

    float pupilOffsetX = eyeDiameter * 0.2f;
    float pupilOffsetY = pupilOffsetX * (cellHeight / cellWidth);
    drawCircle(leftEyeX + foodDirX * pupilOffsetX, leftEyeY + foodDirY * pupilOffsetY, pupilDiameter, BLACK, ctx);
    drawCircle(rightEyeX + foodDirX * pupilOffsetX, rightEyeY + foodDirY * pupilOffsetY, pupilDiameter, BLACK, ctx);
}

void drawBanner(const char* title, const char* subtitle, const RGBColor& bgColor,
                const RGBColor& textColor, const DrawContext& ctx) {
    int centerY = ctx.gridHeight / 2;
    int halfHeight = subtitle ? 2 : 1;

    // Box spans the field width inside the border
    for (int x = 1; x < ctx.gridWidth - 1; x++) {
        for (int y = centerY - halfHeight; y <= centerY + halfHeight; y++) {
            drawSquare(x, y, bgColor, ctx);
        }
    }

    float cellWidth = ctx.cellWidth();
    float cellHeight = ctx.cellHeight();
    float aspect = cellWidth / cellHeight;

    // Largest title that fits the box width
    float titleSize = cellHeight * 0.9f;
    float maxWidth = (ctx.gridWidth - 3) * cellWidth;
    titleSize = std::min(titleSize, titleSize * maxWidth / (textWidth(title, titleSize) * aspect));
    float titleX = -textWidth(title, titleSize) * aspect * 0.5f;
    float titleY = ((centerY + (subtitle ? 0.3f : 0.05f)) * cellHeight) - 1.0f;
    drawText(title, titleX, titleY, titleSize, textColor, ctx);

    if (subtitle) {
        float subSize = std::min(cellHeight * 0.5f, titleSize * 0.6f);
        float subX = -textWidth(subtitle, subSize) * aspect * 0.5f;
        float subY = ((centerY - 1.2f) * cellHeight) - 1.0f;
        drawText(subtitle, subX, subY, subSize, textColor, ctx);
    }
}

} // namespace SnakeDraw
