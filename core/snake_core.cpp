#include "snake_core.h"
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

// ===== DIRECTION HELPERS =====

Point directionVector(Direction direction) {
    switch (direction) {
        case Direction::UP:    return Point(0, -1);
        case Direction::DOWN:  return Point(0, 1);
        case Direction::LEFT:  return Point(-1, 0);
        case Direction::RIGHT: return Point(1, 0);
    }
    return Point(0, 0);
}

Direction oppositeDirection(Direction direction) {
    switch (direction) {
        case Direction::UP:    return Direction::DOWN;
        case Direction::DOWN:  return Direction::UP;
        case Direction::LEFT:  return Direction::RIGHT;
        case Direction::RIGHT: return Direction::LEFT;
    }
    return direction;
}

const char* directionName(Direction direction) {
    switch (direction) {
        case Direction::UP:    return "UP";
        case Direction::DOWN:  return "DOWN";
        case Direction::LEFT:  return "LEFT";
        case Direction::RIGHT: return "RIGHT";
    }
    return "?";
}

const char* gameStateName(GameState state) {
    switch (state) {
        case GameState::RUNNING: return "RUNNING";
        case GameState::WON:     return "WON";
        case GameState::LOST:    return "LOST";
    }
    return "?";
}

const char* tickResultName(TickResult result) {
    switch (result) {
        case TickResult::MOVED:    return "MOVED";
        case TickResult::ATE:      return "ATE";
        case TickResult::LOST:     return "LOST";
        case TickResult::TERMINAL: return "TERMINAL";
    }
    return "?";
}

// ===== SNAKE CORE =====

namespace {

CoreConfig sizedConfig(int width, int height) {
    CoreConfig config;
    config.width = width;
    config.height = height;
    return config;
}

} // anonymous namespace

SnakeCore::SnakeCore(const CoreConfig& config, std::unique_ptr<RandomSource> random)
    : m_config(validateConfig(config)), m_random(std::move(random)),
      m_grid(m_config.width, m_config.height) {
    if (!m_random) {
        throw InvalidConfig("random source is required");
    }
    initializeGame();
}

SnakeCore::SnakeCore(int width, int height, uint32_t seed)
    : SnakeCore(sizedConfig(width, height),
                std::make_unique<MersenneRandomSource>(seed)) {}

const CoreConfig& SnakeCore::validateConfig(const CoreConfig& config) {
    if (config.width < MIN_GRID_SIZE || config.height < MIN_GRID_SIZE) {
        std::ostringstream msg;
        msg << "grid " << config.width << "x" << config.height
            << " is smaller than the minimum " << MIN_GRID_SIZE << "x" << MIN_GRID_SIZE;
        throw InvalidConfig(msg.str());
    }
    if (config.initialLength < 1) {
        throw InvalidConfig("initial snake length must be at least 1");
    }

    // The body trails straight back from the centre cell
    Point head(config.width / 2, config.height / 2);
    Point back = directionVector(oppositeDirection(config.initialDirection));
    Point tail(head.x + back.x * (config.initialLength - 1),
               head.y + back.y * (config.initialLength - 1));
    if (tail.x < 0 || tail.x >= config.width || tail.y < 0 || tail.y >= config.height) {
        std::ostringstream msg;
        msg << "initial snake length " << config.initialLength << " does not fit a "
            << config.width << "x" << config.height << " grid";
        throw InvalidConfig(msg.str());
    }
    return config;
}

void SnakeCore::initializeGame() {
    m_snake.clear();
    m_direction = m_config.initialDirection;
    m_pendingDirection = m_direction;
    m_state = GameState::RUNNING;
    m_score = 0;
    m_hasFood = false;

    Point head(m_config.width / 2, m_config.height / 2);
    Point back = directionVector(oppositeDirection(m_direction));
    for (int i = 0; i < m_config.initialLength; i++) {
        m_snake.push_back(Point(head.x + back.x * i, head.y + back.y * i));
    }

    m_grid.updateFromGameState(m_snake, m_food, false);

    if (!placeFood()) {
        m_state = GameState::WON;
    }
}

void SnakeCore::reset() {
    initializeGame();
}

void SnakeCore::setDirection(Direction direction) {
    if (isTerminal()) return;

    // Reversal is judged against the last move, not the buffered turn
    if (direction == oppositeDirection(m_direction)) return;

    m_pendingDirection = direction;
}

Point SnakeCore::nextHead(const Point& head, Direction direction, bool* inBounds) const {
    Point next = head + directionVector(direction);

    if (m_config.wrapAround) {
        next.x = (next.x + m_config.width) % m_config.width;
        next.y = (next.y + m_config.height) % m_config.height;
    }

    *inBounds = m_grid.isValidPosition(next);
    return next;
}

TickResult SnakeCore::tick() {
    if (isTerminal()) return TickResult::TERMINAL;

    m_direction = m_pendingDirection;

    bool inBounds = false;
    Point newHead = nextHead(m_snake.front(), m_direction, &inBounds);

    if (!inBounds) {
        m_state = GameState::LOST;
        return TickResult::LOST;
    }

    bool eating = m_hasFood && newHead == m_food;
    const Point tail = m_snake.back();

    // The tail cell is vacated this tick unless the snake grows
    if (m_grid.isOccupied(newHead) && (eating || newHead != tail)) {
        m_state = GameState::LOST;
        return TickResult::LOST;
    }

    if (!eating) {
        m_snake.pop_back();
        m_grid.setTile(tail, TileContent::EMPTY);
    }

    if (!m_snake.empty()) {
        m_grid.setTile(m_snake.front(), TileContent::SNAKE_BODY);
    }
    m_snake.push_front(newHead);
    m_grid.setTile(newHead, TileContent::SNAKE_HEAD);

    if (!eating) return TickResult::MOVED;

    m_score++;
    m_hasFood = false;
    if (!placeFood()) {
        m_state = GameState::WON;
    }
    return TickResult::ATE;
}

bool SnakeCore::placeFood() {
    std::vector<Point> freeCells;
    m_grid.collectFreeCells(freeCells);

    if (freeCells.empty()) {
        m_hasFood = false;
        return false;
    }

    int index = m_random->nextIndex(static_cast<int>(freeCells.size()));
    if (index < 0 || index >= static_cast<int>(freeCells.size())) {
        throw std::out_of_range("random source returned index " + std::to_string(index) +
                                " for " + std::to_string(freeCells.size()) + " free cells");
    }
    m_food = freeCells[index];
    m_hasFood = true;
    m_grid.setTile(m_food, TileContent::FOOD);
    return true;
}

CoreSnapshot SnakeCore::snapshot() const {
    CoreSnapshot snap;
    snap.width = m_config.width;
    snap.height = m_config.height;
    snap.snake.assign(m_snake.begin(), m_snake.end());
    snap.food = m_food;
    snap.hasFood = m_hasFood;
    snap.direction = m_direction;
    snap.state = m_state;
    snap.score = m_score;
    return snap;
}
