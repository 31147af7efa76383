#pragma once

#include "snake_config.h"
#include <functional>
#include <memory>

// Forward declarations
typedef unsigned int GLuint;
typedef int GLint;

// ===== SNAKE APP HEADER =====
// Window, GL context, controllers and the event loop.
// Implementation details are in snake_app.cpp

// Event types that the game can subscribe to
enum class EventType {
    GAME_TICK = 0,
    GAME_RENDER,
    GAME_EXIT,
    INPUT_KEYBOARD,
    INPUT_GAMEPAD_BUTTON,
    EVENT_TYPE_COUNT
};

struct Event {
    EventType type;
    float timestamp;

    struct {
        int keyCode = 0;
        int controllerId = 0;
        int buttonId = 0;
        bool isPressed = false;
    } input;

    struct {
        float deltaTime = 0.0f;
        float currentTime = 0.0f;
    } tick;

    Event() : type(EventType::GAME_TICK), timestamp(0.0f) {}
};

using EventCallback = std::function<void(const Event&)>;

// Single in-process queue: every subscriber runs on the loop thread
class EventSystem {
public:
    virtual ~EventSystem() = default;
    virtual void subscribe(EventType eventType, EventCallback callback) = 0;
    virtual void unsubscribe(EventType eventType) = 0;
    virtual void publish(const Event& event) = 0;
};

std::unique_ptr<EventSystem> createEventSystem();

// Main application class (PIMPL pattern for clean interface)
class SnakeApp {
public:
    SnakeApp();
    ~SnakeApp();

    // Non-copyable
    SnakeApp(const SnakeApp&) = delete;
    SnakeApp& operator=(const SnakeApp&) = delete;

    // Core lifecycle
    bool initialize(const AppConfig& config);
    void run();
    // Publishes GAME_EXIT once, then ends the run loop
    void stop();
    void shutdown();

    EventSystem* getEventSystem();

    // Resource access for rendering
    GLuint getShaderProgram() const;
    GLuint getVAO() const;
    GLuint getAppleTexture() const;

    // Timing
    float getCurrentTime() const;

    const AppConfig& getConfig() const;

    void setWindowTitle(const char* title);

    // Uniform locations for rendering
    GLint getOffsetUniform() const;
    GLint getColorUniform() const;
    GLint getScaleUniform() const;
    GLint getShapeTypeUniform() const;
    GLint getTextureUniform() const;
    GLint getUseTextureUniform() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};
