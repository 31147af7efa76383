#include "snake_grid.h"

// TileGrid Implementation
TileGrid::TileGrid(int width, int height)
    : m_width(width), m_height(height), m_tiles(static_cast<size_t>(width) * height) {
    clear();
}

void TileGrid::clear() {
    for (auto& tile : m_tiles) {
        tile = TileContent::EMPTY;
    }
}

TileContent TileGrid::getTile(int x, int y) const {
    if (!isValidPosition(x, y)) return TileContent::EMPTY;
    return m_tiles[indexOf(x, y)];
}

void TileGrid::setTile(int x, int y, TileContent content) {
    if (isValidPosition(x, y)) {
        m_tiles[indexOf(x, y)] = content;
    }
}

bool TileGrid::isOccupied(int x, int y) const {
    if (!isValidPosition(x, y)) return true;
    TileContent tile = m_tiles[indexOf(x, y)];
    return tile != TileContent::EMPTY && tile != TileContent::FOOD;
}

bool TileGrid::isValidPosition(int x, int y) const {
    return x >= 0 && x < m_width && y >= 0 && y < m_height;
}

void TileGrid::updateFromGameState(const std::deque<Point>& snake, const Point& food, bool hasFood) {
    clear();

    if (hasFood) {
        setTile(food, TileContent::FOOD);
    }

    // Body first, then the head on top
    for (size_t i = 1; i < snake.size(); i++) {
        setTile(snake[i], TileContent::SNAKE_BODY);
    }
    if (!snake.empty()) {
        setTile(snake.front(), TileContent::SNAKE_HEAD);
    }
}

void TileGrid::collectFreeCells(std::vector<Point>& cells) const {
    cells.clear();
    cells.reserve(m_tiles.size());

    for (int y = 0; y < m_height; y++) {
        for (int x = 0; x < m_width; x++) {
            if (!isOccupied(x, y)) {
                cells.push_back(Point(x, y));
            }
        }
    }
}

int TileGrid::countFreeCells() const {
    int count = 0;
    for (auto tile : m_tiles) {
        if (tile == TileContent::EMPTY || tile == TileContent::FOOD) {
            count++;
        }
    }
    return count;
}

std::string TileGrid::toText() const {
    std::string text;
    text.reserve(static_cast<size_t>(m_width + 1) * m_height);

    for (int y = 0; y < m_height; y++) {
        for (int x = 0; x < m_width; x++) {
            text += tileToChar(m_tiles[indexOf(x, y)]);
        }
        text += '\n';
    }
    return text;
}

char TileGrid::tileToChar(TileContent tile) {
    switch (tile) {
        case TileContent::EMPTY:
            return ' ';
        case TileContent::SNAKE_HEAD:
            return 'S';
        case TileContent::SNAKE_BODY:
            return 's';
        case TileContent::FOOD:
            return 'F';
        default:
            return '?';
    }
}
