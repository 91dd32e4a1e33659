#pragma once

/**
 * Colour strings
 *
 * Accepted forms: CSS colour keywords (case-insensitive), #rgb, #rgba,
 * #rrggbb, #rrggbbaa, rgb(r, g, b), rgba(r, g, b, a), hsl(h, s, l) and
 * hsla(h, s, l, a). rgb channels are 0-255, or 0-100 when the string contains
 * '%'. Hue is 0-360, saturation and lightness 0-100, alpha 0-1.
 */

#include "easel/errors.h"
#include <cstdint>
#include <string>
#include <variant>

namespace easel {
namespace canvas {

class ColourParseError : public ArgumentError {
public:
    explicit ColourParseError(const std::string& colour)
        : ArgumentError("Invalid colour: '" + colour + "'") {}
};

/**
 * 8-bit straight-alpha colour, ready for the painter.
 */
struct Rgba {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    bool operator==(const Rgba& o) const { return r == o.r && g == o.g && b == o.b && a == o.a; }
    bool operator!=(const Rgba& o) const { return !(*this == o); }
};

// Channel values below are normalized to 0-1.

struct NamedColour {
    std::string name;
    Rgba value;
};

struct HexColour {
    Rgba value;
};

struct RgbColour {
    double r, g, b;
};

struct RgbaColour {
    double r, g, b, a;
};

struct HslColour {
    double h, s, l;
};

struct HslaColour {
    double h, s, l, a;
};

using ColourSpec = std::variant<NamedColour, HexColour, RgbColour, RgbaColour, HslColour, HslaColour>;

/**
 * Parse a colour string.
 * @throws ColourParseError for unknown names, malformed or out-of-range values
 */
ColourSpec parseColour(const std::string& text);

Rgba toRgba(const ColourSpec& spec);

/**
 * parseColour + toRgba
 */
Rgba resolveColour(const std::string& text);

/**
 * Throws ColourParseError unless the string parses.
 */
void validateColour(const std::string& text);

} // namespace canvas
} // namespace easel
