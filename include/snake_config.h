#pragma once

#include <cstdint>
#include <ostream>
#include <string>

// Configuration structure
struct AppConfig {
    bool fullscreen = false;
    int gridWidth = 20;
    int gridHeight = 20;
    int cellSize = 20;            // pixels per grid cell
    int tickIntervalMs = 100;     // time between snake moves
    int initialLength = 3;
    bool wrapAround = false;
    bool hasSeed = false;         // false: seed from std::random_device
    uint32_t seed = 0;
    bool showHelp = false;
    std::string shaderDir = "shaders";
    const char* windowTitle = "Snake";

    // Window size: one border cell on each side, two header rows for the score
    int windowWidth() const { return (gridWidth + 2) * cellSize; }
    int windowHeight() const { return (gridHeight + 4) * cellSize; }
};

// Limits accepted on the command line
constexpr int CONFIG_MAX_GRID = 128;
constexpr int CONFIG_MIN_CELL = 4;
constexpr int CONFIG_MAX_CELL = 64;
constexpr int CONFIG_MIN_INTERVAL_MS = 50;
constexpr int CONFIG_MAX_INTERVAL_MS = 1000;

// Fill config from argv. Returns false with a message in error on bad input.
bool parseAppConfig(int argc, char* argv[], AppConfig& config, std::string& error);

void printUsage(std::ostream& out, const char* program);
