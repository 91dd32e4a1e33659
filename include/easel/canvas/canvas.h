#pragma once

/**
 * Canvas - the recorder handed to draw handlers
 *
 * Each draw call validates its arguments, truncates coordinates to integers
 * and appends one primitive to the frame buffer. Nothing is painted here.
 *
 * Usage:
 *   frame->setDrawHandler([](easel::canvas::Canvas& canvas) {
 *       canvas.drawCircle({150, 100}, 20, 2, "White", "Red");
 *   });
 */

#include "easel/canvas/draw_primitive.h"
#include <optional>
#include <string>
#include <vector>

namespace easel {
namespace canvas {

class Canvas {
public:
    explicit Canvas(FrameBuffer& buffer);

    void drawText(const std::string& text, Vec2 point, double fontSize, const std::string& colour,
                  const std::string& face = "serif");

    void drawLine(Vec2 start, Vec2 end, double lineWidth, const std::string& colour);

    void drawPolyline(const std::vector<Vec2>& points, double lineWidth, const std::string& colour);

    void drawPolygon(const std::vector<Vec2>& points, double lineWidth, const std::string& colour,
                     const std::optional<std::string>& fillColour = std::nullopt);

    void drawCircle(Vec2 center, double radius, double lineWidth, const std::string& colour,
                    const std::optional<std::string>& fillColour = std::nullopt);

    /**
     * Angles in radians. The arc runs clockwise on screen from startAngle to
     * endAngle, measured from 3 o'clock.
     */
    void drawArc(Vec2 center, double radius, double startAngle, double endAngle, double lineWidth,
                 const std::string& colour, const std::optional<std::string>& fillColour = std::nullopt);

    void drawPoint(Vec2 point, const std::string& colour);

    /**
     * Draw the part of the image centred on sourceCenter, sourceSize wide
     * and high, scaled to destSize and centred on destCenter, rotated
     * clockwise by rotation radians. Does nothing while the image is not
     * ready.
     */
    void drawImage(const std::shared_ptr<const assets::ImageAsset>& image, Vec2 sourceCenter,
                   Vec2 sourceSize, Vec2 destCenter, Vec2 destSize, double rotation = 0.0);

    size_t size() const { return buffer_.size(); }

private:
    FrameBuffer& buffer_;
};

} // namespace canvas
} // namespace easel
