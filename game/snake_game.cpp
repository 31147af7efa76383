#include "snake_app.h"
#include "snake_config.h"
#include "snake_draw.h"
#include "snake_input.h"
#include "snake_session.h"
#include "snake_theme.h"
#include "snake_ui.h"
#include <cstdio>
#include <iostream>
#include <memory>

using namespace SnakeTheme;

// ===== GAME LOGIC (event-driven) =====
// Translates app events into session actions and draws the current snapshot.

class SnakeGameLogic {
public:
    SnakeGameLogic(SnakeApp* app, SnakeSession& session)
        : m_app(app), m_session(session), m_ui(app) {
        // Subscribe to events
        auto* eventSystem = m_app->getEventSystem();
        eventSystem->subscribe(EventType::GAME_TICK,
            [this](const Event& e) { onGameTick(e); });
        eventSystem->subscribe(EventType::GAME_RENDER,
            [this](const Event& e) { onRender(e); });
        eventSystem->subscribe(EventType::INPUT_KEYBOARD,
            [this](const Event& e) { onKeyboardInput(e); });
        eventSystem->subscribe(EventType::INPUT_GAMEPAD_BUTTON,
            [this](const Event& e) { onGamepadButton(e); });
        eventSystem->subscribe(EventType::GAME_EXIT,
            [this](const Event& e) { onExit(e); });

        updateWindowTitle();
        std::cout << "🐍 Game logic initialized (event-driven)" << std::endl;
    }

private:
    void onGameTick(const Event& event) {
        if (m_session.update(event.tick.currentTime)) {
            updateWindowTitle();
        }
    }

    void onRender(const Event& event) {
        glClear(GL_COLOR_BUFFER_BIT);
        glClearColor(0.1f, 0.1f, 0.1f, 1.0f);

        glUseProgram(m_app->getShaderProgram());
        glBindVertexArray(m_app->getVAO());

        CoreSnapshot snapshot = m_session.core().snapshot();
        auto ctx = m_ui.getDrawContext();

        drawFood(snapshot, ctx);
        drawSnake(snapshot, ctx);

        m_ui.renderUI(snapshot, m_session.getBestScore(), m_session.isPaused());
    }

    void onKeyboardInput(const Event& event) {
        if (!event.input.isPressed) return; // Only handle key press
        dispatch(mapKeyboardKey(event.input.keyCode));
    }

    void onGamepadButton(const Event& event) {
        if (!event.input.isPressed) return;
        dispatch(mapGamepadButton(event.input.buttonId));
    }

    void onExit(const Event& event) {
        m_session.logSummary(std::cout);
    }

    void dispatch(InputAction action) {
        if (action == InputAction::NONE) return;

        m_session.handleAction(action);
        if (m_session.shouldQuit()) {
            std::cout << "🚪 Quit requested" << std::endl;
            m_app->stop();
            return;
        }
        if (action == InputAction::CONFIRM || action == InputAction::RESET) {
            updateWindowTitle();
        }
    }

    void updateWindowTitle() {
        const SnakeCore& core = m_session.core();
        char title[96];
        snprintf(title, sizeof(title), "%s - Score: %d (%s)", m_app->getConfig().windowTitle,
                 core.getScore(), gameStateName(core.state()));
        m_app->setWindowTitle(title);
    }

    void drawFood(const CoreSnapshot& snapshot, const SnakeDraw::DrawContext& ctx) {
        if (!snapshot.hasFood) return;

        Point cell = SnakeDraw::fieldToDraw(snapshot.food, snapshot.height);
        GLuint appleTexture = m_app->getAppleTexture();
        if (appleTexture != 0) {
            SnakeDraw::drawTexturedSquare(cell.x, cell.y, appleTexture, ctx);
        } else {
            SnakeDraw::drawSquare(cell.x, cell.y, GameColors::FOOD, ctx);
        }
    }

    void drawSnake(const CoreSnapshot& snapshot, const SnakeDraw::DrawContext& ctx) {
        if (snapshot.snake.empty()) return;

        bool lost = snapshot.state == GameState::LOST;
        RGBColor bodyColor = GameColors::SNAKE * (lost ? StateColors::SNAKE_LOST_INTENSITY
                                                       : StateColors::SNAKE_BODY_INTENSITY);
        RGBColor headColor = GameColors::SNAKE * (lost ? StateColors::SNAKE_LOST_INTENSITY
                                                       : StateColors::SNAKE_HEAD_INTENSITY);

        // Body first so the head is never covered
        for (size_t i = 1; i < snapshot.snake.size(); i++) {
            Point cell = SnakeDraw::fieldToDraw(snapshot.snake[i], snapshot.height);
            SnakeDraw::drawSquare(cell.x, cell.y, bodyColor, ctx);
        }

        Point head = SnakeDraw::fieldToDraw(snapshot.snake[0], snapshot.height);
        SnakeDraw::drawSquare(head.x, head.y, headColor, ctx);

        // Draw grid has y up, field directions have y down
        Point dir = directionVector(snapshot.direction);
        Point food = SnakeDraw::fieldToDraw(snapshot.food, snapshot.height);
        SnakeDraw::drawSnakeEyes(head, food, snapshot.hasFood, Point(dir.x, -dir.y), ctx);
    }

    SnakeApp* m_app;
    SnakeSession& m_session;
    SnakeUI m_ui;
};

// ===== MAIN FUNCTION =====

int main(int argc, char* argv[]) {
    std::cout << "🐍 Snake Game" << std::endl;
    std::cout << "==========================================" << std::endl;

    // Parse command line arguments
    AppConfig config;
    std::string error;
    if (!parseAppConfig(argc, argv, config, error)) {
        std::cerr << "❌ " << error << std::endl;
        printUsage(std::cerr, argv[0]);
        return 1;
    }
    if (config.showHelp) {
        printUsage(std::cout, argv[0]);
        return 0;
    }

    // Game state before any window, so a bad grid fails fast
    std::unique_ptr<SnakeSession> session;
    try {
        session = std::make_unique<SnakeSession>(config);
    } catch (const InvalidConfig& e) {
        std::cerr << "❌ Invalid game configuration: " << e.what() << std::endl;
        return 1;
    }

    // Create and initialize app infrastructure
    auto app = std::make_unique<SnakeApp>();
    if (!app->initialize(config)) {
        std::cerr << "❌ Failed to initialize app infrastructure" << std::endl;
        return -1;
    }

    // Create game logic (subscribes to events automatically)
    auto gameLogic = std::make_unique<SnakeGameLogic>(app.get(), *session);

    std::cout << "\n🎮 Controls: Arrow Keys/WASD, Enter=Restart, Space=Pause, R=Reset, +/-=Speed, Esc=Quit" << std::endl;
    std::cout << "==========================================\n" << std::endl;

    // Run the application (event-driven loop)
    app->run();

    // Cleanup
    gameLogic.reset();
    app->shutdown();

    std::cout << "👋 Thanks for playing! Best score: " << session->getBestScore() << std::endl;
    return 0;
}
