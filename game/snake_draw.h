#pragma once

#include "snake_dep.h"

namespace SnakeDraw {

// Drawing context structure that holds OpenGL uniform locations and grid dimensions.
// The draw grid has y pointing up: row 0 is the bottom border.
struct DrawContext {
    // Draw grid dimensions (field plus border and header rows)
    int gridWidth;
    int gridHeight;

    // OpenGL uniform locations
    GLint u_offset;
    GLint u_color;
    GLint u_scale;
    GLint u_shape_type;
    GLint u_texture;
    GLint u_use_texture;

    DrawContext(int gw, int gh, GLint offset, GLint color, GLint scale, GLint shape_type,
                GLint texture, GLint use_texture)
        : gridWidth(gw), gridHeight(gh), u_offset(offset), u_color(color), u_scale(scale),
          u_shape_type(shape_type), u_texture(texture), u_use_texture(use_texture) {}

    float cellWidth() const { return 2.0f / gridWidth; }
    float cellHeight() const { return 2.0f / gridHeight; }
};

// Field cell (y down, origin top-left) to draw cell (y up, inside the border)
Point fieldToDraw(const Point& cell, int fieldHeight);

// Basic drawing functions
void drawSquare(int x, int y, const RGBColor& color, const DrawContext& ctx);
void drawSmallSquare(float x, float y, float size, const RGBColor& color, const DrawContext& ctx);
void drawCircle(float x, float y, float diameter, const RGBColor& color, const DrawContext& ctx);
void drawTexturedSquare(int x, int y, GLuint texture, const DrawContext& ctx);

// Text rendering functions
void drawChar(char c, float startX, float startY, float charSize, const RGBColor& color, const DrawContext& ctx);
void drawText(const char* text, float startX, float startY, float charSize, const RGBColor& color, const DrawContext& ctx);
float textWidth(const char* text, float charSize);

// Game entity drawing functions
void drawSnakeEyes(const Point& head, const Point& food, bool hasFood, Point direction,
                   const DrawContext& ctx);

// Centered box with one or two lines of text
void drawBanner(const char* title, const char* subtitle, const RGBColor& bgColor,
                const RGBColor& textColor, const DrawContext& ctx);

} // namespace SnakeDraw
