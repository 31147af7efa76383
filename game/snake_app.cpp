#include "snake_dep.h"  // IWYU pragma: keep
#include "snake_app.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

// ===== SNAKE APP PIMPL IMPLEMENTATION =====

class SnakeApp::Impl {
public:
    AppConfig config;
    std::unique_ptr<EventSystem> eventSystem;

    // SDL/OpenGL resources
    SDL_Window* window = nullptr;
    SDL_GLContext glContext = nullptr;
    std::vector<SDL_GameController*> gameControllers;
    bool sdlInitialized = false;

    // OpenGL resources
    GLuint shaderProgram = 0;
    GLuint VAO = 0;
    GLuint VBO = 0;
    GLuint EBO = 0;
    GLuint appleTexture = 0;

    // Uniform locations
    GLint u_offset = -1;
    GLint u_color = -1;
    GLint u_scale = -1;
    GLint u_shape_type = -1;
    GLint u_texture = -1;
    GLint u_use_texture = -1;

    // Application state
    bool running = false;
    float currentTime = 0.0f;
    float deltaTime = 0.0f;
    float lastFrameTime = 0.0f;

    Impl() : eventSystem(createEventSystem()) {}

    // ===== LOW-LEVEL IMPLEMENTATION METHODS =====

    bool initializeSDL() {
        if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_GAMECONTROLLER) < 0) {
            std::cerr << "❌ Failed to initialize SDL2: " << SDL_GetError() << std::endl;
            return false;
        }
        sdlInitialized = true;

        SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 3);
        SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
        SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

        if (config.fullscreen) {
            window = SDL_CreateWindow(config.windowTitle,
                SDL_WINDOWPOS_UNDEFINED, SDL_WINDOWPOS_UNDEFINED,
                config.windowWidth(), config.windowHeight(),
                SDL_WINDOW_OPENGL | SDL_WINDOW_FULLSCREEN_DESKTOP);
        } else {
            window = SDL_CreateWindow(config.windowTitle,
                SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                config.windowWidth(), config.windowHeight(), SDL_WINDOW_OPENGL);
        }

        if (!window) {
            std::cerr << "❌ Failed to create window: " << SDL_GetError() << std::endl;
            return false;
        }

        glContext = SDL_GL_CreateContext(window);
        if (!glContext) {
            std::cerr << "❌ Failed to create OpenGL context: " << SDL_GetError() << std::endl;
            return false;
        }

        SDL_GL_SetSwapInterval(1);
        return true;
    }

    bool initializeOpenGL() {
        if (!gladLoadGL((GLADloadfunc)SDL_GL_GetProcAddress)) {
            std::cerr << "❌ Failed to initialize GLAD" << std::endl;
            return false;
        }

        // Fullscreen keeps the board square-celled and centred
        int drawableWidth = 0, drawableHeight = 0;
        SDL_GL_GetDrawableSize(window, &drawableWidth, &drawableHeight);
        float scale = std::min(drawableWidth / (float)config.windowWidth(),
                               drawableHeight / (float)config.windowHeight());
        int viewWidth = (int)(config.windowWidth() * scale);
        int viewHeight = (int)(config.windowHeight() * scale);
        glViewport((drawableWidth - viewWidth) / 2, (drawableHeight - viewHeight) / 2,
                   viewWidth, viewHeight);
        return true;
    }

    bool initializeControllers() {
        int numJoysticks = SDL_NumJoysticks();
        std::cout << "🎮 Found " << numJoysticks << " joysticks" << std::endl;

        for (int i = 0; i < numJoysticks && i < 4; i++) {
            if (!SDL_IsGameController(i)) continue;
            SDL_GameController* controller = SDL_GameControllerOpen(i);
            if (controller) {
                gameControllers.push_back(controller);
                std::cout << "🎮 Controller " << i << ": " << SDL_GameControllerName(controller) << std::endl;
            }
        }

        return true;
    }

    bool loadShaders() {
        std::string vertexPath = config.shaderDir + "/vertex.vs";
        std::string fragmentPath = config.shaderDir + "/fragment.fs";
        std::string vertexShaderSource = loadShaderFromFile(vertexPath.c_str());
        std::string fragmentShaderSource = loadShaderFromFile(fragmentPath.c_str());

        if (vertexShaderSource.empty() || fragmentShaderSource.empty()) {
            std::cerr << "❌ Failed to load shader files from " << config.shaderDir << std::endl;
            return false;
        }

        GLuint vertexShader = compileShader(vertexShaderSource, GL_VERTEX_SHADER, "Vertex");
        GLuint fragmentShader = compileShader(fragmentShaderSource, GL_FRAGMENT_SHADER, "Fragment");

        if (vertexShader == 0 || fragmentShader == 0) {
            if (vertexShader != 0) glDeleteShader(vertexShader);
            if (fragmentShader != 0) glDeleteShader(fragmentShader);
            return false;
        }

        shaderProgram = glCreateProgram();
        glAttachShader(shaderProgram, vertexShader);
        glAttachShader(shaderProgram, fragmentShader);
        glLinkProgram(shaderProgram);

        glDeleteShader(vertexShader);
        glDeleteShader(fragmentShader);

        GLint linked = 0;
        glGetProgramiv(shaderProgram, GL_LINK_STATUS, &linked);
        if (!linked) {
            GLchar infoLog[512];
            glGetProgramInfoLog(shaderProgram, 512, NULL, infoLog);
            std::cerr << "❌ Shader program link failed: " << infoLog << std::endl;
            return false;
        }

        // Get uniforms
        u_offset = glGetUniformLocation(shaderProgram, "u_offset");
        u_color = glGetUniformLocation(shaderProgram, "u_color");
        u_scale = glGetUniformLocation(shaderProgram, "u_scale");
        u_shape_type = glGetUniformLocation(shaderProgram, "u_shape_type");
        u_texture = glGetUniformLocation(shaderProgram, "u_texture");
        u_use_texture = glGetUniformLocation(shaderProgram, "u_use_texture");

        return true;
    }

    bool setupRenderResources() {
        // Unit quad: position xy, texcoord uv
        float squareVertices[] = {
            0.0f, 0.0f, 0.0f, 1.0f,
            1.0f, 0.0f, 1.0f, 1.0f,
            1.0f, 1.0f, 1.0f, 0.0f,
            0.0f, 1.0f, 0.0f, 0.0f
        };

        GLuint indices[] = {0, 1, 2, 2, 3, 0};

        glGenVertexArrays(1, &VAO);
        glGenBuffers(1, &VBO);
        glGenBuffers(1, &EBO);

        glBindVertexArray(VAO);
        glBindBuffer(GL_ARRAY_BUFFER, VBO);
        glBufferData(GL_ARRAY_BUFFER, sizeof(squareVertices), squareVertices, GL_STATIC_DRAW);
        glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, EBO);
        glBufferData(GL_ELEMENT_ARRAY_BUFFER, sizeof(indices), indices, GL_STATIC_DRAW);

        glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, 4 * sizeof(float), (void*)0);
        glEnableVertexAttribArray(0);
        glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, 4 * sizeof(float), (void*)(2 * sizeof(float)));
        glEnableVertexAttribArray(1);

        return true;
    }

    void updateTimers() {
        float newTime = SDL_GetTicks() / 1000.0f;
        deltaTime = newTime - lastFrameTime;
        lastFrameTime = newTime;
        currentTime = newTime;
    }

    void handleSDLEvents() {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            switch (event.type) {
                case SDL_QUIT:
                    publishExitEvent();
                    break;
                case SDL_KEYDOWN:
                    if (event.key.repeat == 0) {
                        publishKeyboardEvent(event.key.keysym.sym, true);
                    }
                    break;
                case SDL_CONTROLLERBUTTONDOWN:
                    publishGamepadButtonEvent(event.cbutton.which, event.cbutton.button, true);
                    break;
                case SDL_CONTROLLERDEVICEADDED:
                    openController(event.cdevice.which);
                    break;
                case SDL_CONTROLLERDEVICEREMOVED:
                    closeController(event.cdevice.which);
                    break;
                default:
                    break;
            }
        }
    }

    void openController(int deviceIndex) {
        if (gameControllers.size() >= 4) return;
        // Already opened during initializeControllers()
        if (SDL_GameControllerFromInstanceID(SDL_JoystickGetDeviceInstanceID(deviceIndex))) return;
        SDL_GameController* controller = SDL_GameControllerOpen(deviceIndex);
        if (controller) {
            gameControllers.push_back(controller);
            std::cout << "🎮 Controller connected: " << SDL_GameControllerName(controller) << std::endl;
        }
    }

    // which is the joystick instance id for removal events
    void closeController(SDL_JoystickID instanceId) {
        auto it = std::find_if(gameControllers.begin(), gameControllers.end(),
                               [instanceId](SDL_GameController* controller) {
                                   return SDL_JoystickInstanceID(
                                              SDL_GameControllerGetJoystick(controller)) == instanceId;
                               });
        if (it == gameControllers.end()) return;
        std::cout << "🎮 Controller disconnected: " << SDL_GameControllerName(*it) << std::endl;
        SDL_GameControllerClose(*it);
        gameControllers.erase(it);
    }

    void publishExitEvent() {
        Event exitEvent;
        exitEvent.type = EventType::GAME_EXIT;
        exitEvent.timestamp = currentTime;
        eventSystem->publish(exitEvent);
        running = false;
    }

    void publishKeyboardEvent(int keyCode, bool pressed) {
        Event inputEvent;
        inputEvent.type = EventType::INPUT_KEYBOARD;
        inputEvent.timestamp = currentTime;
        inputEvent.input.keyCode = keyCode;
        inputEvent.input.isPressed = pressed;
        eventSystem->publish(inputEvent);
    }

    void publishGamepadButtonEvent(int controllerId, int buttonId, bool pressed) {
        Event inputEvent;
        inputEvent.type = EventType::INPUT_GAMEPAD_BUTTON;
        inputEvent.timestamp = currentTime;
        inputEvent.input.controllerId = controllerId;
        inputEvent.input.buttonId = buttonId;
        inputEvent.input.isPressed = pressed;
        eventSystem->publish(inputEvent);
    }

    void cleanup() {
        for (auto controller : gameControllers) {
            if (controller) {
                SDL_GameControllerClose(controller);
            }
        }
        gameControllers.clear();

        if (glContext) {
            if (VAO != 0) glDeleteVertexArrays(1, &VAO);
            if (VBO != 0) glDeleteBuffers(1, &VBO);
            if (EBO != 0) glDeleteBuffers(1, &EBO);
            if (shaderProgram != 0) glDeleteProgram(shaderProgram);
            if (appleTexture != 0) glDeleteTextures(1, &appleTexture);
            VAO = VBO = EBO = shaderProgram = appleTexture = 0;

            SDL_GL_DeleteContext(glContext);
            glContext = nullptr;
        }
        if (window) {
            SDL_DestroyWindow(window);
            window = nullptr;
        }

        if (sdlInitialized) {
            SDL_Quit();
            sdlInitialized = false;
        }
    }

    // Utility functions
    std::string loadShaderFromFile(const char* filepath) {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            std::cerr << "❌ Cannot open shader " << filepath << std::endl;
            return "";
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    GLuint compileShader(const std::string& source, GLenum shaderType, const char* shaderName) {
        GLuint shader = glCreateShader(shaderType);
        const char* sourcePtr = source.c_str();
        glShaderSource(shader, 1, &sourcePtr, NULL);
        glCompileShader(shader);

        GLint success;
        glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
        if (!success) {
            GLchar infoLog[512];
            glGetShaderInfoLog(shader, 512, NULL, infoLog);
            std::cerr << "❌ " << shaderName << " shader compilation failed: " << infoLog << std::endl;
            glDeleteShader(shader);
            return 0;
        }

        return shader;
    }

    GLuint createAppleBitmap() {
        // 16x16 red apple with a green stem
        const int size = 16;
        unsigned char appleData[size * size * 4]; // RGBA

        for (int y = 0; y < size; y++) {
            for (int x = 0; x < size; x++) {
                int idx = (y * size + x) * 4;

                float centerX = size / 2.0f;
                float centerY = size / 2.0f + 1;
                float dist = std::sqrt((x - centerX) * (x - centerX) + (y - centerY) * (y - centerY));

                if (dist < size / 2.5f) {
                    // Red apple body, lighter toward the top left
                    bool shine = (x - centerX + 3) * (x - centerX + 3) + (y - centerY + 3) * (y - centerY + 3) < 4;
                    appleData[idx + 0] = shine ? 255 : 220;
                    appleData[idx + 1] = shine ? 140 : 20;
                    appleData[idx + 2] = shine ? 140 : 20;
                    appleData[idx + 3] = 255;
                } else if (y < 4 && x >= 7 && x <= 8) {
                    // Green stem
                    appleData[idx + 0] = 20;
                    appleData[idx + 1] = 150;
                    appleData[idx + 2] = 20;
                    appleData[idx + 3] = 255;
                } else {
                    appleData[idx + 0] = 0;
                    appleData[idx + 1] = 0;
                    appleData[idx + 2] = 0;
                    appleData[idx + 3] = 0;
                }
            }
        }

        GLuint texture;
        glGenTextures(1, &texture);
        glBindTexture(GL_TEXTURE_2D, texture);

        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, size, size, 0, GL_RGBA,
                     GL_UNSIGNED_BYTE, appleData);

        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);

        std::cout << "🍎 Created procedural apple bitmap (ID: " << texture << ")" << std::endl;
        return texture;
    }
};

// ===== SNAKE APP PUBLIC INTERFACE =====

SnakeApp::SnakeApp() : m_impl(std::make_unique<Impl>()) {}

SnakeApp::~SnakeApp() {
    shutdown();
}

bool SnakeApp::initialize(const AppConfig& config) {
    m_impl->config = config;

    if (!m_impl->initializeSDL() ||
        !m_impl->initializeOpenGL() ||
        !m_impl->initializeControllers() ||
        !m_impl->loadShaders() ||
        !m_impl->setupRenderResources()) {
        m_impl->cleanup();
        return false;
    }
    m_impl->appleTexture = m_impl->createAppleBitmap();

    m_impl->running = true;
    m_impl->currentTime = SDL_GetTicks() / 1000.0f;
    m_impl->lastFrameTime = m_impl->currentTime;

    std::cout << "✅ Snake Application initialized (" << config.windowWidth() << "x"
              << config.windowHeight() << ")" << std::endl;
    return true;
}

void SnakeApp::run() {
    if (!m_impl->running) return;

    while (m_impl->running) {
        m_impl->updateTimers();
        m_impl->handleSDLEvents();
        if (!m_impl->running) break;

        Event tickEvent;
        tickEvent.type = EventType::GAME_TICK;
        tickEvent.timestamp = m_impl->currentTime;
        tickEvent.tick.deltaTime = m_impl->deltaTime;
        tickEvent.tick.currentTime = m_impl->currentTime;
        m_impl->eventSystem->publish(tickEvent);

        Event renderEvent;
        renderEvent.type = EventType::GAME_RENDER;
        renderEvent.timestamp = m_impl->currentTime;
        m_impl->eventSystem->publish(renderEvent);

        SDL_GL_SwapWindow(m_impl->window);
    }
}

void SnakeApp::stop() {
    if (!m_impl->running) return;
    m_impl->publishExitEvent();
}

void SnakeApp::shutdown() {
    if (!m_impl->sdlInitialized) return;

    m_impl->running = false;
    m_impl->cleanup();
    std::cout << "✅ Snake Application shut down" << std::endl;
}

// Getters
EventSystem* SnakeApp::getEventSystem() { return m_impl->eventSystem.get(); }
GLuint SnakeApp::getShaderProgram() const { return m_impl->shaderProgram; }
GLuint SnakeApp::getVAO() const { return m_impl->VAO; }
GLuint SnakeApp::getAppleTexture() const { return m_impl->appleTexture; }
float SnakeApp::getCurrentTime() const { return m_impl->currentTime; }
const AppConfig& SnakeApp::getConfig() const { return m_impl->config; }

void SnakeApp::setWindowTitle(const char* title) {
    if (m_impl->window) {
        SDL_SetWindowTitle(m_impl->window, title);
    }
}

// Uniform getters
GLint SnakeApp::getOffsetUniform() const { return m_impl->u_offset; }
GLint SnakeApp::getColorUniform() const { return m_impl->u_color; }
GLint SnakeApp::getScaleUniform() const { return m_impl->u_scale; }
GLint SnakeApp::getShapeTypeUniform() const { return m_impl->u_shape_type; }
GLint SnakeApp::getTextureUniform() const { return m_impl->u_texture; }
GLint SnakeApp::getUseTextureUniform() const { return m_impl->u_use_texture; }
