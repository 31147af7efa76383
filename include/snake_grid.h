#pragma once

#include "snake_types.h"
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

// Tile Content System - occupancy used for collision detection and food placement
enum class TileContent : uint8_t {
    EMPTY = 0,
    SNAKE_HEAD = 1,
    SNAKE_BODY = 2,
    FOOD = 3
};

// Tile Grid Management
class TileGrid {
public:
    TileGrid(int width, int height);

    // Basic operations
    void clear();
    TileContent getTile(int x, int y) const;
    TileContent getTile(const Point& pos) const { return getTile(pos.x, pos.y); }
    void setTile(int x, int y, TileContent content);
    void setTile(const Point& pos, TileContent content) { setTile(pos.x, pos.y, content); }
    bool isOccupied(int x, int y) const;
    bool isOccupied(const Point& pos) const { return isOccupied(pos.x, pos.y); }
    bool isValidPosition(int x, int y) const;
    bool isValidPosition(const Point& pos) const { return isValidPosition(pos.x, pos.y); }

    // Rebuild every tile from the snake body (head first) and the food cell
    void updateFromGameState(const std::deque<Point>& snake, const Point& food, bool hasFood);

    // Food placement support: non-snake cells in row-major order
    void collectFreeCells(std::vector<Point>& cells) const;
    int countFreeCells() const;

    // Text dump, one row per line: ' ' empty, 'S' head, 's' body, 'F' food
    std::string toText() const;

    // Getters
    int getWidth() const { return m_width; }
    int getHeight() const { return m_height; }

private:
    int m_width, m_height;
    std::vector<TileContent> m_tiles; // row-major

    int indexOf(int x, int y) const { return y * m_width + x; }
    static char tileToChar(TileContent tile);
};
