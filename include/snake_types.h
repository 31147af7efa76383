#pragma once

// Fundamental types for the snake game
// No other header dependency here

struct ix2 {
    int x, y;

    // Default constructor
    constexpr ix2(int x = 0, int y = 0) : x(x), y(y) {}

    // Equality operators
    inline bool operator==(const ix2 &other) const {
        return x == other.x && y == other.y;
    }
    inline bool operator!=(const ix2 &other) const {
        return !(*this == other);
    }

    // Component-wise add (head + direction vector)
    constexpr ix2 operator+(const ix2 &other) const {
        return ix2(x + other.x, y + other.y);
    }
};

struct fx3 {
    float r, g, b;

    constexpr fx3(float r = 0.0f, float g = 0.0f, float b = 0.0f) : r(r), g(g), b(b) {}

    inline bool operator==(const fx3 &other) const {
        return r == other.r && g == other.g && b == other.b;
    }

    // Multiply by a scalar
    constexpr fx3 operator*(float s) const {
        return fx3(r * s, g * s, b * s);
    }
};

// Grid cell (x grows right, y grows down, (0,0) is top-left)
struct Point : ix2 {
    constexpr Point(int x = 0, int y = 0) : ix2(x, y) {}
    constexpr Point(const ix2& other) : ix2(other) {}
};
