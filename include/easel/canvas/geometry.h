#pragma once

namespace easel {
namespace canvas {

/**
 * Coordinates as sketches pass them; may be fractional.
 */
struct Vec2 {
    double x = 0.0;
    double y = 0.0;
};

/**
 * Device coordinates as recorded. Fractional input is truncated toward zero;
 * the canvas rejects values that are not finite or do not fit an int.
 */
struct Point {
    int x = 0;
    int y = 0;

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

struct Size {
    int width = 0;
    int height = 0;

    bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size& other) const { return !(*this == other); }
};

} // namespace canvas
} // namespace easel
