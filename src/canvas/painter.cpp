/**
 * Painter Implementation
 *
 * One Skia raster surface per canvas. Colours arrive as the strings the
 * sketch recorded and are resolved here; they were validated at record time.
 */

#include "easel/canvas/painter.h"
#include "easel/assets/image_asset.h"
#include "easel/canvas/colour.h"
#include "easel/canvas/font.h"
#include <iostream>
#include <unordered_map>

#include "include/core/SkCanvas.h"
#include "include/core/SkColor.h"
#include "include/core/SkFont.h"
#include "include/core/SkImageInfo.h"
#include "include/core/SkPaint.h"
#include "include/core/SkPath.h"
#include "include/core/SkPathBuilder.h"
#include "include/core/SkPixmap.h"
#include "include/core/SkRect.h"
#include "include/core/SkSamplingOptions.h"
#include "include/core/SkSurface.h"

namespace easel {
namespace canvas {

struct Painter::Impl {
    sk_sp<SkSurface> surface;
    SkCanvas* canvas = nullptr;  // Owned by surface
    const FontCatalog& fonts;
    std::unordered_map<std::string, SkColor> colours;

    Impl(int width, int height, const FontCatalog& f) : fonts(f) {
        SkImageInfo info = SkImageInfo::Make(width, height, kRGBA_8888_SkColorType, kPremul_SkAlphaType);
        surface = SkSurfaces::Raster(info);
        if (surface) {
            canvas = surface->getCanvas();
            canvas->clear(SK_ColorBLACK);
        } else {
            std::cerr << "[Render] Failed to create " << width << "x" << height << " surface" << std::endl;
        }
    }

    SkColor colour(const std::string& text) {
        auto it = colours.find(text);
        if (it != colours.end()) {
            return it->second;
        }
        Rgba c = resolveColour(text);
        SkColor value = SkColorSetARGB(c.a, c.r, c.g, c.b);
        colours.emplace(text, value);
        return value;
    }

    SkPaint makeFillPaint(const std::string& fill) {
        SkPaint paint;
        paint.setAntiAlias(true);
        paint.setStyle(SkPaint::kFill_Style);
        paint.setColor(colour(fill));
        return paint;
    }

    SkPaint makeStrokePaint(const std::string& stroke, int lineWidth) {
        SkPaint paint;
        paint.setAntiAlias(true);
        paint.setStyle(SkPaint::kStroke_Style);
        paint.setStrokeWidth(static_cast<SkScalar>(lineWidth));
        paint.setColor(colour(stroke));
        return paint;
    }

    SkPath makePath(const std::vector<Point>& points, bool closed) {
        SkPathBuilder builder;
        builder.moveTo(points.front().x, points.front().y);
        for (size_t i = 1; i < points.size(); i++) {
            builder.lineTo(points[i].x, points[i].y);
        }
        if (closed) {
            builder.close();
        }
        return builder.snapshot();
    }

    // ========================================================================
    // Primitives
    // ========================================================================

    void operator()(const LinePrimitive& p) {
        canvas->drawLine(p.start.x, p.start.y, p.end.x, p.end.y, makeStrokePaint(p.lineColour, p.lineWidth));
    }

    void operator()(const PolylinePrimitive& p) {
        canvas->drawPath(makePath(p.points, false), makeStrokePaint(p.lineColour, p.lineWidth));
    }

    void operator()(const PolygonPrimitive& p) {
        SkPath path = makePath(p.points, true);
        if (p.fillColour) {
            canvas->drawPath(path, makeFillPaint(*p.fillColour));
        }
        canvas->drawPath(path, makeStrokePaint(p.lineColour, p.lineWidth));
    }

    void operator()(const CirclePrimitive& p) {
        if (p.fillColour) {
            canvas->drawCircle(p.center.x, p.center.y, p.radius, makeFillPaint(*p.fillColour));
        }
        canvas->drawCircle(p.center.x, p.center.y, p.radius, makeStrokePaint(p.lineColour, p.lineWidth));
    }

    void operator()(const ArcPrimitive& p) {
        SkRect oval = SkRect::MakeXYWH(p.center.x - p.radius, p.center.y - p.radius,
                                       2 * p.radius, 2 * p.radius);
        // Stored angles run counter-clockwise in 1/16 degree; Skia's run clockwise in degrees
        SkScalar start = -p.startAngle / 16.0f;
        SkScalar sweep = -p.sweepAngle / 16.0f;
        bool pie = p.fillColour.has_value();
        if (pie) {
            canvas->drawArc(oval, start, sweep, true, makeFillPaint(*p.fillColour));
        }
        canvas->drawArc(oval, start, sweep, pie, makeStrokePaint(p.lineColour, p.lineWidth));
    }

    void operator()(const PointPrimitive& p) {
        canvas->drawRect(SkRect::MakeXYWH(p.point.x, p.point.y, 1, 1), makeFillPaint(p.colour));
    }

    void operator()(const TextPrimitive& p) {
        SkFont font = fonts.font(p.face, static_cast<float>(p.fontSize));
        canvas->drawString(p.text.c_str(), p.point.x, p.point.y, font, makeFillPaint(p.colour));
    }

    void operator()(const ImagePrimitive& p) {
        auto view = p.image->prepareView(p.sourceCenter, p.sourceSize, p.destSize, p.rotation);
        if (!view) {
            return;
        }
        SkScalar left = p.destCenter.x - view->width / 2.0f;
        SkScalar top = p.destCenter.y - view->height / 2.0f;
        canvas->drawImage(view->image.get(), left, top, SkSamplingOptions(SkFilterMode::kLinear), nullptr);
    }
};

Painter::Painter(int width, int height, const FontCatalog& fonts)
    : impl_(std::make_unique<Impl>(width, height, fonts)), width_(width), height_(height) {}

Painter::~Painter() = default;

void Painter::paint(const FrameBuffer& buffer, const std::string& background) {
    if (!impl_->canvas) return;

    impl_->canvas->clear(impl_->colour(background));
    for (const auto& primitive : buffer) {
        impl_->canvas->save();
        std::visit(*impl_, primitive);
        impl_->canvas->restore();
    }
}

const uint8_t* Painter::pixels() const {
    if (!impl_->surface) return nullptr;

    SkPixmap pixmap;
    if (impl_->surface->peekPixels(&pixmap)) {
        return static_cast<const uint8_t*>(pixmap.addr());
    }
    return nullptr;
}

size_t Painter::rowBytes() const {
    return static_cast<size_t>(width_) * 4;
}

} // namespace canvas
} // namespace easel
