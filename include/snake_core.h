#pragma once

#include "snake_types.h"
#include "snake_grid.h"
#include "snake_random.h"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

// ===== GAME LOOP CORE =====
// Grid, snake body, food and win/loss state. No I/O, no timers, no input
// parsing: a driver calls setDirection() and tick(), a renderer reads state.

constexpr int MIN_GRID_SIZE = 4;

enum class Direction : uint8_t {
    UP = 0,
    DOWN,
    LEFT,
    RIGHT
};

enum class GameState : uint8_t {
    RUNNING = 0,
    WON,
    LOST
};

enum class TickResult : uint8_t {
    MOVED = 0,
    ATE,
    LOST,
    TERMINAL
};

Point directionVector(Direction direction);
Direction oppositeDirection(Direction direction);
const char* directionName(Direction direction);
const char* gameStateName(GameState state);
const char* tickResultName(TickResult result);

// Thrown by SnakeCore construction when the grid cannot hold a game
class InvalidConfig : public std::invalid_argument {
public:
    explicit InvalidConfig(const std::string& what) : std::invalid_argument(what) {}
};

struct CoreConfig {
    int width = 20;
    int height = 20;
    int initialLength = 3;
    Direction initialDirection = Direction::RIGHT;
    bool wrapAround = false; // leave one edge, re-enter on the opposite one
};

// Value copy of everything a renderer needs for one frame
struct CoreSnapshot {
    int width = 0;
    int height = 0;
    std::vector<Point> snake; // head first
    Point food;
    bool hasFood = false;
    Direction direction = Direction::RIGHT;
    GameState state = GameState::RUNNING;
    int score = 0;
};

class SnakeCore {
public:
    SnakeCore(const CoreConfig& config, std::unique_ptr<RandomSource> random);
    SnakeCore(int width, int height, uint32_t seed);

    // Non-copyable (owns the random stream)
    SnakeCore(const SnakeCore&) = delete;
    SnakeCore& operator=(const SnakeCore&) = delete;

    // Buffer the direction for the next tick. Ignored when it reverses the
    // direction of the last move or when the game is over.
    void setDirection(Direction direction);

    // Advance the snake one cell. Throws std::out_of_range when the random
    // source picks a food index outside the free cells.
    TickResult tick();

    GameState state() const { return m_state; }
    CoreSnapshot snapshot() const;

    // Start a new game with the same configuration
    void reset();

    // Getters
    int getWidth() const { return m_config.width; }
    int getHeight() const { return m_config.height; }
    const std::deque<Point>& getSnake() const { return m_snake; }
    const Point& getHead() const { return m_snake.front(); }
    size_t getLength() const { return m_snake.size(); }
    const Point& getFood() const { return m_food; }
    bool hasFood() const { return m_hasFood; }
    Direction getDirection() const { return m_direction; }
    int getScore() const { return m_score; }
    bool isTerminal() const { return m_state != GameState::RUNNING; }
    const CoreConfig& getConfig() const { return m_config; }
    const TileGrid& getGrid() const { return m_grid; }

private:
    void initializeGame();
    bool placeFood();
    static const CoreConfig& validateConfig(const CoreConfig& config);
    Point nextHead(const Point& head, Direction direction, bool* inBounds) const;

    CoreConfig m_config;
    std::unique_ptr<RandomSource> m_random;
    TileGrid m_grid;

    std::deque<Point> m_snake;
    Direction m_direction = Direction::RIGHT;        // direction of the last move
    Direction m_pendingDirection = Direction::RIGHT; // applied on the next tick
    Point m_food;
    bool m_hasFood = false;
    GameState m_state = GameState::RUNNING;
    int m_score = 0;
};
