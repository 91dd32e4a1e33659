#pragma once

/**
 * Draw primitives
 *
 * One value per draw call, built by the recorder and never mutated. Equality
 * is structural over every field; the render surface compares whole frame
 * buffers with it to decide whether a repaint is needed.
 */

#include "easel/canvas/font.h"
#include "easel/canvas/geometry.h"
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace easel {
namespace assets {
class ImageAsset;
}

namespace canvas {

struct LinePrimitive {
    Point start;
    Point end;
    int lineWidth = 1;
    std::string lineColour;

    bool operator==(const LinePrimitive& o) const {
        return start == o.start && end == o.end && lineWidth == o.lineWidth && lineColour == o.lineColour;
    }
};

struct PolylinePrimitive {
    std::vector<Point> points;
    int lineWidth = 1;
    std::string lineColour;

    bool operator==(const PolylinePrimitive& o) const {
        return points == o.points && lineWidth == o.lineWidth && lineColour == o.lineColour;
    }
};

struct PolygonPrimitive {
    std::vector<Point> points;
    int lineWidth = 1;
    std::string lineColour;
    std::optional<std::string> fillColour;

    bool operator==(const PolygonPrimitive& o) const {
        return points == o.points && lineWidth == o.lineWidth && lineColour == o.lineColour &&
               fillColour == o.fillColour;
    }
};

struct CirclePrimitive {
    Point center;
    int radius = 0;
    int lineWidth = 1;
    std::string lineColour;
    std::optional<std::string> fillColour;

    bool operator==(const CirclePrimitive& o) const {
        return center == o.center && radius == o.radius && lineWidth == o.lineWidth &&
               lineColour == o.lineColour && fillColour == o.fillColour;
    }
};

// Angles in sixteenths of a degree; see angles.h
struct ArcPrimitive {
    Point center;
    int radius = 0;
    int startAngle = 0;
    int sweepAngle = 0;
    int lineWidth = 1;
    std::string lineColour;
    std::optional<std::string> fillColour;

    bool operator==(const ArcPrimitive& o) const {
        return center == o.center && radius == o.radius && startAngle == o.startAngle &&
               sweepAngle == o.sweepAngle && lineWidth == o.lineWidth &&
               lineColour == o.lineColour && fillColour == o.fillColour;
    }
};

struct PointPrimitive {
    Point point;
    std::string colour;

    bool operator==(const PointPrimitive& o) const {
        return point == o.point && colour == o.colour;
    }
};

struct TextPrimitive {
    std::string text;
    Point point;   // baseline-left
    int fontSize = 12;
    std::string colour;
    FontFace face = FontFace::Serif;

    bool operator==(const TextPrimitive& o) const {
        return text == o.text && point == o.point && fontSize == o.fontSize &&
               colour == o.colour && face == o.face;
    }
};

struct ImagePrimitive {
    std::shared_ptr<const assets::ImageAsset> image;   // compared by identity
    Point sourceCenter;
    Size sourceSize;
    Point destCenter;
    Size destSize;
    double rotation = 0.0;

    bool operator==(const ImagePrimitive& o) const {
        return image == o.image && sourceCenter == o.sourceCenter && sourceSize == o.sourceSize &&
               destCenter == o.destCenter && destSize == o.destSize && rotation == o.rotation;
    }
};

using DrawPrimitive = std::variant<LinePrimitive, PolylinePrimitive, PolygonPrimitive, CirclePrimitive,
                                   ArcPrimitive, PointPrimitive, TextPrimitive, ImagePrimitive>;

/**
 * Everything one draw callback emitted, in emission (z) order.
 */
using FrameBuffer = std::vector<DrawPrimitive>;

} // namespace canvas
} // namespace easel
