#include "snake_session.h"
#include <algorithm>
#include <iostream>
#include <utility>

namespace {

std::unique_ptr<RandomSource> makeRandomSource(const AppConfig& config) {
    uint32_t seed = config.hasSeed ? config.seed : makeRandomSeed();
    std::cout << "🎲 Food seed: " << seed << std::endl;
    return std::make_unique<MersenneRandomSource>(seed);
}

} // anonymous namespace

SnakeSession::SnakeSession(const AppConfig& config)
    : SnakeSession(config, makeRandomSource(config)) {}

SnakeSession::SnakeSession(const AppConfig& config, std::unique_ptr<RandomSource> random)
    : m_core(makeCoreConfig(config), std::move(random)),
      m_tickInterval(config.tickIntervalMs / 1000.0f) {
    m_tickInterval = std::min(MAX_TICK_INTERVAL, std::max(MIN_TICK_INTERVAL, m_tickInterval));

    std::cout << "🐍 Game started on " << m_core.getWidth() << "x" << m_core.getHeight()
              << " grid" << (config.wrapAround ? " (wrap-around)" : "") << std::endl;
    std::cout << "🍎 Food placed at (" << m_core.getFood().x << "," << m_core.getFood().y << ")" << std::endl;
}

CoreConfig SnakeSession::makeCoreConfig(const AppConfig& config) {
    CoreConfig coreConfig;
    coreConfig.width = config.gridWidth;
    coreConfig.height = config.gridHeight;
    coreConfig.initialLength = config.initialLength;
    coreConfig.wrapAround = config.wrapAround;
    return coreConfig;
}

void SnakeSession::handleAction(InputAction action) {
    switch (action) {
        case InputAction::MOVE_UP:
            changeDirection(Direction::UP);
            break;
        case InputAction::MOVE_DOWN:
            changeDirection(Direction::DOWN);
            break;
        case InputAction::MOVE_LEFT:
            changeDirection(Direction::LEFT);
            break;
        case InputAction::MOVE_RIGHT:
            changeDirection(Direction::RIGHT);
            break;

        case InputAction::CONFIRM:
            if (m_core.isTerminal()) {
                restart();
            } else if (m_paused) {
                m_paused = false;
                std::cout << "▶️ Game resumed" << std::endl;
            }
            break;

        case InputAction::RESET:
            restart();
            break;

        case InputAction::PAUSE:
            if (m_core.isTerminal()) break;
            m_paused = !m_paused;
            std::cout << (m_paused ? "⏸️ Game paused" : "▶️ Game resumed") << std::endl;
            break;

        case InputAction::SPEED_UP:
            m_tickInterval = std::max(MIN_TICK_INTERVAL, m_tickInterval - TICK_INTERVAL_STEP);
            std::cout << "⚡ Speed increased! Interval: " << m_tickInterval << "s" << std::endl;
            break;

        case InputAction::SPEED_DOWN:
            m_tickInterval = std::min(MAX_TICK_INTERVAL, m_tickInterval + TICK_INTERVAL_STEP);
            std::cout << "🐢 Speed decreased! Interval: " << m_tickInterval << "s" << std::endl;
            break;

        case InputAction::QUIT:
            m_quit = true;
            break;

        default:
            break;
    }
}

void SnakeSession::changeDirection(Direction direction) {
    if (m_paused) return;
    m_core.setDirection(direction);
}

bool SnakeSession::update(float currentTime) {
    if (!m_clockStarted) {
        m_clockStarted = true;
        m_lastTickTime = currentTime;
        return false;
    }

    if (m_paused || m_core.isTerminal()) {
        m_lastTickTime = currentTime;
        return false;
    }

    if (currentTime - m_lastTickTime < m_tickInterval) return false;

    m_lastTickTime = currentTime;
    onTickResult(m_core.tick());
    return true;
}

void SnakeSession::onTickResult(TickResult result) {
    m_lastResult = result;

    switch (result) {
        case TickResult::ATE:
            m_bestScore = std::max(m_bestScore, m_core.getScore());
            std::cout << "🍎 Snake ate! Score: " << m_core.getScore() << std::endl;
            if (m_core.state() == GameState::WON) {
                std::cout << "🏆 Grid filled, you win! Score: " << m_core.getScore() << std::endl;
            } else {
                std::cout << "🍎 Food placed at (" << m_core.getFood().x << ","
                          << m_core.getFood().y << ")" << std::endl;
            }
            break;

        case TickResult::LOST:
            std::cout << "💥 Snake crashed heading " << directionName(m_core.getDirection())
                      << "! Score: " << m_core.getScore() << ", best: " << m_bestScore << std::endl;
            std::cout << m_core.getGrid().toText();
            break;

        default:
            break;
    }
}

void SnakeSession::restart() {
    std::cout << "🔄 Restarting game..." << std::endl;
    m_core.reset();
    m_paused = false;
    m_clockStarted = false;
    m_lastResult = TickResult::MOVED;
    m_gamesPlayed++;
    std::cout << "🍎 Food placed at (" << m_core.getFood().x << "," << m_core.getFood().y << ")" << std::endl;
}

void SnakeSession::logSummary(std::ostream& out) const {
    out << "🐍 Played " << m_gamesPlayed << " game(s), best score " << m_bestScore << std::endl;
}
