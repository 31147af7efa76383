#pragma once

#include "snake_config.h"
#include "snake_core.h"
#include "snake_input.h"
#include <memory>
#include <ostream>

// ===== SNAKE SESSION =====
// Driver around the single SnakeCore: the only caller of setDirection() and
// tick(). Fed from the app's event queue, so calls never interleave.

constexpr float MIN_TICK_INTERVAL = 0.05f;
constexpr float MAX_TICK_INTERVAL = 1.0f;
constexpr float TICK_INTERVAL_STEP = 0.05f;

class SnakeSession {
public:
    explicit SnakeSession(const AppConfig& config);
    SnakeSession(const AppConfig& config, std::unique_ptr<RandomSource> random);

    void handleAction(InputAction action);

    // Ticks the core once when a full interval has passed. Returns true on a tick.
    bool update(float currentTime);

    void restart();

    const SnakeCore& core() const { return m_core; }
    SnakeCore& core() { return m_core; }

    bool isPaused() const { return m_paused; }
    bool shouldQuit() const { return m_quit; }
    float getTickInterval() const { return m_tickInterval; }
    int getBestScore() const { return m_bestScore; }
    int getGamesPlayed() const { return m_gamesPlayed; }
    TickResult getLastResult() const { return m_lastResult; }

    // One line with games played and best score
    void logSummary(std::ostream& out) const;

private:
    static CoreConfig makeCoreConfig(const AppConfig& config);
    void changeDirection(Direction direction);
    void onTickResult(TickResult result);

    SnakeCore m_core;

    bool m_paused = false;
    bool m_quit = false;
    bool m_clockStarted = false;
    float m_lastTickTime = 0.0f;
    float m_tickInterval = 0.1f;

    int m_bestScore = 0;
    int m_gamesPlayed = 1;
    TickResult m_lastResult = TickResult::MOVED;
};
