#include "snake_config.h"
#include "snake_core.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace {

bool parseInt(const char* text, long long minValue, long long maxValue, long long& value) {
    if (!text || *text == '\0') return false;

    char* end = nullptr;
    errno = 0;
    long long parsed = strtoll(text, &end, 10);
    if (errno != 0 || *end != '\0') return false;
    if (parsed < minValue || parsed > maxValue) return false;

    value = parsed;
    return true;
}

// Reads the integer following argv[i] into value, within [minValue, maxValue]
bool takeIntArg(int argc, char* argv[], int& i, long long minValue, long long maxValue,
                long long& value, std::string& error) {
    const char* flag = argv[i];
    if (i + 1 >= argc) {
        error = std::string("missing value for ") + flag;
        return false;
    }
    const char* text = argv[++i];
    if (!parseInt(text, minValue, maxValue, value)) {
        error = std::string("invalid value '") + text + "' for " + flag + " (expected " +
                std::to_string(minValue) + ".." + std::to_string(maxValue) + ")";
        return false;
    }
    return true;
}

} // anonymous namespace

bool parseAppConfig(int argc, char* argv[], AppConfig& config, std::string& error) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        long long value = 0;

        if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0) {
            config.showHelp = true;
        } else if (strcmp(arg, "--width") == 0) {
            if (!takeIntArg(argc, argv, i, MIN_GRID_SIZE, CONFIG_MAX_GRID, value, error)) return false;
            config.gridWidth = static_cast<int>(value);
        } else if (strcmp(arg, "--height") == 0) {
            if (!takeIntArg(argc, argv, i, MIN_GRID_SIZE, CONFIG_MAX_GRID, value, error)) return false;
            config.gridHeight = static_cast<int>(value);
        } else if (strcmp(arg, "--cell") == 0) {
            if (!takeIntArg(argc, argv, i, CONFIG_MIN_CELL, CONFIG_MAX_CELL, value, error)) return false;
            config.cellSize = static_cast<int>(value);
        } else if (strcmp(arg, "--interval") == 0) {
            if (!takeIntArg(argc, argv, i, CONFIG_MIN_INTERVAL_MS, CONFIG_MAX_INTERVAL_MS, value, error)) return false;
            config.tickIntervalMs = static_cast<int>(value);
        } else if (strcmp(arg, "--seed") == 0) {
            if (!takeIntArg(argc, argv, i, 0, 4294967295LL, value, error)) return false;
            config.seed = static_cast<uint32_t>(value);
            config.hasSeed = true;
        } else if (strcmp(arg, "--length") == 0) {
            if (!takeIntArg(argc, argv, i, 1, CONFIG_MAX_GRID, value, error)) return false;
            config.initialLength = static_cast<int>(value);
        } else if (strcmp(arg, "--wrap") == 0) {
            config.wrapAround = true;
        } else if (strcmp(arg, "--fullscreen") == 0) {
            config.fullscreen = true;
        } else if (strcmp(arg, "--shaders") == 0) {
            if (i + 1 >= argc) {
                error = "missing value for --shaders";
                return false;
            }
            config.shaderDir = argv[++i];
        } else {
            error = std::string("unknown option '") + arg + "'";
            return false;
        }
    }
    return true;
}

void printUsage(std::ostream& out, const char* program) {
    out << "Usage: " << program << " [options]\n"
        << "  --width N       grid width in cells (" << MIN_GRID_SIZE << ".." << CONFIG_MAX_GRID << ", default 20)\n"
        << "  --height N      grid height in cells (" << MIN_GRID_SIZE << ".." << CONFIG_MAX_GRID << ", default 20)\n"
        << "  --cell N        cell size in pixels (" << CONFIG_MIN_CELL << ".." << CONFIG_MAX_CELL << ", default 20)\n"
        << "  --interval MS   tick interval (" << CONFIG_MIN_INTERVAL_MS << ".." << CONFIG_MAX_INTERVAL_MS << ", default 100)\n"
        << "  --seed N        fixed food placement seed\n"
        << "  --length N      initial snake length (default 3)\n"
        << "  --wrap          wrap around the edges instead of dying\n"
        << "  --fullscreen    run fullscreen\n"
        << "  --shaders DIR   shader directory (default shaders)\n"
        << "  --help          show this message\n";
}
