#include "easel/canvas/canvas.h"
#include "easel/canvas/angles.h"
#include "easel/canvas/colour.h"
#include "easel/assets/image_asset.h"
#include "easel/errors.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace easel {
namespace canvas {

namespace {

// Truncation toward zero must land inside int
bool fitsInt(double value) {
    return std::isfinite(value) &&
           value > static_cast<double>(std::numeric_limits<int>::min()) - 1.0 &&
           value < static_cast<double>(std::numeric_limits<int>::max()) + 1.0;
}

int checkedInt(double value, const char* what) {
    if (!fitsInt(value)) {
        throw ArgumentError(std::string(what) + " must be a finite number in range");
    }
    return static_cast<int>(value);
}

Point checkedPoint(const Vec2& v) {
    return {checkedInt(v.x, "Coordinate"), checkedInt(v.y, "Coordinate")};
}

Size checkedSize(const Vec2& v) {
    return {checkedInt(v.x, "Size"), checkedInt(v.y, "Size")};
}

int checkedLineWidth(double lineWidth) {
    if (!(lineWidth > 0.0)) {
        throw ArgumentError("Line width must be positive");
    }
    // Widths below one pixel still draw a hairline
    return std::max(1, checkedInt(lineWidth, "Line width"));
}

int checkedRadius(double radius) {
    if (!(radius >= 0.0)) {
        throw ArgumentError("Radius must not be negative");
    }
    return checkedInt(radius, "Radius");
}

constexpr size_t kKnownColourLimit = 256;

// Sketches pass the same few colour strings every frame
void checkedColour(const std::string& colour) {
    static thread_local std::unordered_set<std::string> known;
    if (known.count(colour)) return;
    validateColour(colour);
    if (known.size() >= kKnownColourLimit) known.clear();
    known.insert(colour);
}

std::vector<Point> checkedPoints(const std::vector<Vec2>& points) {
    if (points.empty()) {
        throw ArgumentError("Point list must not be empty");
    }
    std::vector<Point> out;
    out.reserve(points.size());
    for (const auto& p : points) {
        out.push_back(checkedPoint(p));
    }
    return out;
}

std::optional<std::string> checkedFill(const std::optional<std::string>& fillColour) {
    if (fillColour) {
        checkedColour(*fillColour);
    }
    return fillColour;
}

} // namespace

Canvas::Canvas(FrameBuffer& buffer) : buffer_(buffer) {}

void Canvas::drawText(const std::string& text, Vec2 point, double fontSize, const std::string& colour,
                      const std::string& face) {
    validateText(text);
    validateFontSize(fontSize);
    checkedColour(colour);
    Point at = checkedPoint(point);
    int size = std::max(1, checkedInt(fontSize, "Font size"));

    TextPrimitive prim;
    prim.text = text;
    prim.point = at;
    prim.fontSize = size;
    prim.colour = colour;
    prim.face = parseFontFace(face);
    buffer_.emplace_back(std::move(prim));
}

void Canvas::drawLine(Vec2 start, Vec2 end, double lineWidth, const std::string& colour) {
    checkedColour(colour);

    LinePrimitive prim;
    prim.start = checkedPoint(start);
    prim.end = checkedPoint(end);
    prim.lineWidth = checkedLineWidth(lineWidth);
    prim.lineColour = colour;
    buffer_.emplace_back(std::move(prim));
}

void Canvas::drawPolyline(const std::vector<Vec2>& points, double lineWidth, const std::string& colour) {
    checkedColour(colour);

    PolylinePrimitive prim;
    prim.points = checkedPoints(points);
    prim.lineWidth = checkedLineWidth(lineWidth);
    prim.lineColour = colour;
    buffer_.emplace_back(std::move(prim));
}

void Canvas::drawPolygon(const std::vector<Vec2>& points, double lineWidth, const std::string& colour,
                         const std::optional<std::string>& fillColour) {
    checkedColour(colour);

    PolygonPrimitive prim;
    prim.points = checkedPoints(points);
    prim.lineWidth = checkedLineWidth(lineWidth);
    prim.lineColour = colour;
    prim.fillColour = checkedFill(fillColour);
    buffer_.emplace_back(std::move(prim));
}

void Canvas::drawCircle(Vec2 center, double radius, double lineWidth, const std::string& colour,
                        const std::optional<std::string>& fillColour) {
    checkedColour(colour);

    CirclePrimitive prim;
    prim.center = checkedPoint(center);
    prim.radius = checkedRadius(radius);
    prim.lineWidth = checkedLineWidth(lineWidth);
    prim.lineColour = colour;
    prim.fillColour = checkedFill(fillColour);
    buffer_.emplace_back(std::move(prim));
}

void Canvas::drawArc(Vec2 center, double radius, double startAngle, double endAngle, double lineWidth,
                     const std::string& colour, const std::optional<std::string>& fillColour) {
    checkedColour(colour);

    NativeArc arc = toNativeArc(startAngle, endAngle);

    ArcPrimitive prim;
    prim.center = checkedPoint(center);
    prim.radius = checkedRadius(radius);
    prim.startAngle = arc.start;
    prim.sweepAngle = arc.sweep;
    prim.lineWidth = checkedLineWidth(lineWidth);
    prim.lineColour = colour;
    prim.fillColour = checkedFill(fillColour);
    buffer_.emplace_back(std::move(prim));
}

void Canvas::drawPoint(Vec2 point, const std::string& colour) {
    checkedColour(colour);

    PointPrimitive prim;
    prim.point = checkedPoint(point);
    prim.colour = colour;
    buffer_.emplace_back(std::move(prim));
}

void Canvas::drawImage(const std::shared_ptr<const assets::ImageAsset>& image, Vec2 sourceCenter,
                       Vec2 sourceSize, Vec2 destCenter, Vec2 destSize, double rotation) {
    if (!image) {
        throw ArgumentError("drawImage requires an image");
    }
    if (!std::isfinite(rotation)) {
        throw ArgumentError("Rotation must be a finite number");
    }
    Point srcCenter = checkedPoint(sourceCenter);
    Size srcSize = checkedSize(sourceSize);
    Point dstCenter = checkedPoint(destCenter);
    Size dstSize = checkedSize(destSize);

    // Loading or failed: nothing to draw yet
    if (image->width() == 0 || image->height() == 0) {
        return;
    }

    ImagePrimitive prim;
    prim.image = image;
    prim.sourceCenter = srcCenter;
    prim.sourceSize = srcSize;
    prim.destCenter = dstCenter;
    prim.destSize = dstSize;
    prim.rotation = rotation;
    buffer_.emplace_back(std::move(prim));
}

} // namespace canvas
} // namespace easel
