#include "easel/canvas/colour.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <regex>
#include <vector>

namespace easel {
namespace canvas {

// ============================================================================
// CSS colour keywords
// ============================================================================

namespace {

struct NamedEntry {
    const char* name;
    uint32_t rgb;
};

// Sorted by name for binary search
const NamedEntry kNamedColours[] = {
    {"aliceblue", 0xF0F8FF}, {"antiquewhite", 0xFAEBD7}, {"aqua", 0x00FFFF},
    {"aquamarine", 0x7FFFD4}, {"azure", 0xF0FFFF}, {"beige", 0xF5F5DC},
    {"bisque", 0xFFE4C4}, {"black", 0x000000}, {"blanchedalmond", 0xFFEBCD},
    {"blue", 0x0000FF}, {"blueviolet", 0x8A2BE2}, {"brown", 0xA52A2A},
    {"burlywood", 0xDEB887}, {"cadetblue", 0x5F9EA0}, {"chartreuse", 0x7FFF00},
    {"chocolate", 0xD2691E}, {"coral", 0xFF7F50}, {"cornflowerblue", 0x6495ED},
    {"cornsilk", 0xFFF8DC}, {"crimson", 0xDC143C}, {"cyan", 0x00FFFF},
    {"darkblue", 0x00008B}, {"darkcyan", 0x008B8B}, {"darkgoldenrod", 0xB8860B},
    {"darkgray", 0xA9A9A9}, {"darkgreen", 0x006400}, {"darkgrey", 0xA9A9A9},
    {"darkkhaki", 0xBDB76B}, {"darkmagenta", 0x8B008B}, {"darkolivegreen", 0x556B2F},
    {"darkorange", 0xFF8C00}, {"darkorchid", 0x9932CC}, {"darkred", 0x8B0000},
    {"darksalmon", 0xE9967A}, {"darkseagreen", 0x8FBC8F}, {"darkslateblue", 0x483D8B},
    {"darkslategray", 0x2F4F4F}, {"darkslategrey", 0x2F4F4F}, {"darkturquoise", 0x00CED1},
    {"darkviolet", 0x9400D3}, {"deeppink", 0xFF1493}, {"deepskyblue", 0x00BFFF},
    {"dimgray", 0x696969}, {"dimgrey", 0x696969}, {"dodgerblue", 0x1E90FF},
    {"firebrick", 0xB22222}, {"floralwhite", 0xFFFAF0}, {"forestgreen", 0x228B22},
    {"fuchsia", 0xFF00FF}, {"gainsboro", 0xDCDCDC}, {"ghostwhite", 0xF8F8FF},
    {"gold", 0xFFD700}, {"goldenrod", 0xDAA520}, {"gray", 0x808080},
    {"green", 0x008000}, {"greenyellow", 0xADFF2F}, {"grey", 0x808080},
    {"honeydew", 0xF0FFF0}, {"hotpink", 0xFF69B4}, {"indianred", 0xCD5C5C},
    {"indigo", 0x4B0082}, {"ivory", 0xFFFFF0}, {"khaki", 0xF0E68C},
    {"lavender", 0xE6E6FA}, {"lavenderblush", 0xFFF0F5}, {"lawngreen", 0x7CFC00},
    {"lemonchiffon", 0xFFFACD}, {"lightblue", 0xADD8E6}, {"lightcoral", 0xF08080},
    {"lightcyan", 0xE0FFFF}, {"lightgoldenrodyellow", 0xFAFAD2}, {"lightgray", 0xD3D3D3},
    {"lightgreen", 0x90EE90}, {"lightgrey", 0xD3D3D3}, {"lightpink", 0xFFB6C1},
    {"lightsalmon", 0xFFA07A}, {"lightseagreen", 0x20B2AA}, {"lightskyblue", 0x87CEFA},
    {"lightslategray", 0x778899}, {"lightslategrey", 0x778899}, {"lightsteelblue", 0xB0C4DE},
    {"lightyellow", 0xFFFFE0}, {"lime", 0x00FF00}, {"limegreen", 0x32CD32},
    {"linen", 0xFAF0E6}, {"magenta", 0xFF00FF}, {"maroon", 0x800000},
    {"mediumaquamarine", 0x66CDAA}, {"mediumblue", 0x0000CD}, {"mediumorchid", 0xBA55D3},
    {"mediumpurple", 0x9370DB}, {"mediumseagreen", 0x3CB371}, {"mediumslateblue", 0x7B68EE},
    {"mediumspringgreen", 0x00FA9A}, {"mediumturquoise", 0x48D1CC}, {"mediumvioletred", 0xC71585},
    {"midnightblue", 0x191970}, {"mintcream", 0xF5FFFA}, {"mistyrose", 0xFFE4E1},
    {"moccasin", 0xFFE4B5}, {"navajowhite", 0xFFDEAD}, {"navy", 0x000080},
    {"oldlace", 0xFDF5E6}, {"olive", 0x808000}, {"olivedrab", 0x6B8E23},
    {"orange", 0xFFA500}, {"orangered", 0xFF4500}, {"orchid", 0xDA70D6},
    {"palegoldenrod", 0xEEE8AA}, {"palegreen", 0x98FB98}, {"paleturquoise", 0xAFEEEE},
    {"palevioletred", 0xDB7093}, {"papayawhip", 0xFFEFD5}, {"peachpuff", 0xFFDAB9},
    {"peru", 0xCD853F}, {"pink", 0xFFC0CB}, {"plum", 0xDDA0DD},
    {"powderblue", 0xB0E0E6}, {"purple", 0x800080}, {"rebeccapurple", 0x663399},
    {"red", 0xFF0000}, {"rosybrown", 0xBC8F8F}, {"royalblue", 0x4169E1},
    {"saddlebrown", 0x8B4513}, {"salmon", 0xFA8072}, {"sandybrown", 0xF4A460},
    {"seagreen", 0x2E8B57}, {"seashell", 0xFFF5EE}, {"sienna", 0xA0522D},
    {"silver", 0xC0C0C0}, {"skyblue", 0x87CEEB}, {"slateblue", 0x6A5ACD},
    {"slategray", 0x708090}, {"slategrey", 0x708090}, {"snow", 0xFFFAFA},
    {"springgreen", 0x00FF7F}, {"steelblue", 0x4682B4}, {"tan", 0xD2B48C},
    {"teal", 0x008080}, {"thistle", 0xD8BFD8}, {"tomato", 0xFF6347},
    {"turquoise", 0x40E0D0}, {"violet", 0xEE82EE}, {"wheat", 0xF5DEB3},
    {"white", 0xFFFFFF}, {"whitesmoke", 0xF5F5F5}, {"yellow", 0xFFFF00},
    {"yellowgreen", 0x9ACD32},
};

bool findNamed(const std::string& lower, Rgba& out) {
    if (lower == "transparent") {
        out = Rgba{0, 0, 0, 0};
        return true;
    }
    auto begin = std::begin(kNamedColours);
    auto end = std::end(kNamedColours);
    auto it = std::lower_bound(begin, end, lower, [](const NamedEntry& entry, const std::string& key) {
        return std::strcmp(entry.name, key.c_str()) < 0;
    });
    if (it == end || lower != it->name) {
        return false;
    }
    out.r = static_cast<uint8_t>((it->rgb >> 16) & 0xFF);
    out.g = static_cast<uint8_t>((it->rgb >> 8) & 0xFF);
    out.b = static_cast<uint8_t>(it->rgb & 0xFF);
    out.a = 255;
    return true;
}

std::string trimmedLower(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    size_t last = text.find_last_not_of(" \t\r\n");
    std::string out = text.substr(first, last - first + 1);
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

bool parseHex(const std::string& lower, Rgba& out) {
    std::string digits = lower.substr(1);
    size_t len = digits.size();
    if (len != 3 && len != 4 && len != 6 && len != 8) {
        return false;
    }
    std::vector<int> values;
    for (char c : digits) {
        int v = hexDigit(c);
        if (v < 0) return false;
        values.push_back(v);
    }

    auto channel = [&](size_t index) -> uint8_t {
        if (len <= 4) {
            return static_cast<uint8_t>(values[index] * 17);
        }
        return static_cast<uint8_t>(values[index * 2] * 16 + values[index * 2 + 1]);
    };

    out.r = channel(0);
    out.g = channel(1);
    out.b = channel(2);
    out.a = (len == 4 || len == 8) ? channel(3) : 255;
    return true;
}

// Functional notation: prefix followed by 3 or 4 numbers, each divided by
// its factor and required to land in [0, 1]. The closing ')' is optional.
bool parseComponents(const std::string& lower, const double factors[4], std::vector<double>& out) {
    static const std::regex numberRegex(R"((\d+\.?\d*|\.\d+))");

    auto begin = std::sregex_iterator(lower.begin(), lower.end(), numberRegex);
    auto end = std::sregex_iterator();
    for (auto it = begin; it != end; ++it) {
        out.push_back(std::stod(it->str()));
    }

    if (out.size() < 3 || out.size() > 4) {
        return false;
    }
    for (size_t i = 0; i < out.size(); i++) {
        out[i] /= factors[i];
        if (out[i] < 0.0 || out[i] > 1.0) {
            return false;
        }
    }
    return true;
}

uint8_t toByte(double unit) {
    return static_cast<uint8_t>(std::lround(std::clamp(unit, 0.0, 1.0) * 255.0));
}

double hueToChannel(double p, double q, double t) {
    if (t < 0.0) t += 1.0;
    if (t > 1.0) t -= 1.0;
    if (t < 1.0 / 6.0) return p + (q - p) * 6.0 * t;
    if (t < 1.0 / 2.0) return q;
    if (t < 2.0 / 3.0) return p + (q - p) * (2.0 / 3.0 - t) * 6.0;
    return p;
}

Rgba fromHsl(double h, double s, double l, double a) {
    double r = l, g = l, b = l;
    if (s > 0.0) {
        double q = l < 0.5 ? l * (1.0 + s) : l + s - l * s;
        double p = 2.0 * l - q;
        r = hueToChannel(p, q, h + 1.0 / 3.0);
        g = hueToChannel(p, q, h);
        b = hueToChannel(p, q, h - 1.0 / 3.0);
    }
    return Rgba{toByte(r), toByte(g), toByte(b), toByte(a)};
}

bool startsWith(const std::string& s, const char* prefix) {
    return s.compare(0, std::strlen(prefix), prefix) == 0;
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

ColourSpec parseColour(const std::string& text) {
    std::string lower = trimmedLower(text);
    if (lower.empty()) {
        throw ColourParseError(text);
    }

    if (lower[0] == '#') {
        HexColour hex;
        if (!parseHex(lower, hex.value)) {
            throw ColourParseError(text);
        }
        return hex;
    }

    if (startsWith(lower, "rgb")) {
        double scale = lower.find('%') != std::string::npos ? 100.0 : 255.0;
        const double factors[4] = {scale, scale, scale, 1.0};
        std::vector<double> v;
        if (!parseComponents(lower, factors, v)) {
            throw ColourParseError(text);
        }
        if (v.size() == 4) {
            return RgbaColour{v[0], v[1], v[2], v[3]};
        }
        return RgbColour{v[0], v[1], v[2]};
    }

    if (startsWith(lower, "hsl")) {
        const double factors[4] = {360.0, 100.0, 100.0, 1.0};
        std::vector<double> v;
        if (!parseComponents(lower, factors, v)) {
            throw ColourParseError(text);
        }
        if (v.size() == 4) {
            return HslaColour{v[0], v[1], v[2], v[3]};
        }
        return HslColour{v[0], v[1], v[2]};
    }

    NamedColour named;
    if (!findNamed(lower, named.value)) {
        throw ColourParseError(text);
    }
    named.name = lower;
    return named;
}

Rgba toRgba(const ColourSpec& spec) {
    struct Visitor {
        Rgba operator()(const NamedColour& c) const { return c.value; }
        Rgba operator()(const HexColour& c) const { return c.value; }
        Rgba operator()(const RgbColour& c) const {
            return Rgba{toByte(c.r), toByte(c.g), toByte(c.b), 255};
        }
        Rgba operator()(const RgbaColour& c) const {
            return Rgba{toByte(c.r), toByte(c.g), toByte(c.b), toByte(c.a)};
        }
        Rgba operator()(const HslColour& c) const { return fromHsl(c.h, c.s, c.l, 1.0); }
        Rgba operator()(const HslaColour& c) const { return fromHsl(c.h, c.s, c.l, c.a); }
    };
    return std::visit(Visitor{}, spec);
}

Rgba resolveColour(const std::string& text) {
    return toRgba(parseColour(text));
}

void validateColour(const std::string& text) {
    parseColour(text);
}

} // namespace canvas
} // namespace easel
