#include "easel/canvas/render_surface.h"
#include "easel/canvas/colour.h"

namespace easel {
namespace canvas {

RenderSurface::RenderSurface(async::EventLoop& loop, RepaintTarget& target, uint64_t intervalMs)
    : target_(target), intervalMs_(intervalMs), timer_(loop) {}

void RenderSurface::setDrawHandler(DrawHandler handler) {
    handler_ = std::move(handler);
    timer_.stop();
    if (started_) {
        scheduleTicks();
    }
}

void RenderSurface::start() {
    if (started_ || closed_) {
        return;
    }
    started_ = true;
    scheduleTicks();
}

void RenderSurface::close() {
    closed_ = true;
    timer_.close();
}

void RenderSurface::scheduleTicks() {
    if (!handler_ || closed_) {
        return;
    }
    timer_.start(intervalMs_, [this]() { tick(); });
}

bool RenderSurface::tick() {
    if (!handler_ || closed_) {
        return false;
    }
    ticks_++;

    FrameBuffer next;
    Canvas canvas(next);
    // Copy: the handler may replace itself
    DrawHandler handler = handler_;
    handler(canvas);

    // The handler may have closed the surface
    if (closed_ || next == buffer_) {
        return false;
    }

    buffer_ = std::move(next);
    repaints_++;
    target_.requestRepaint();
    return true;
}

void RenderSurface::setBackground(const std::string& colour) {
    validateColour(colour);
    if (colour == background_) {
        return;
    }
    background_ = colour;
    if (!closed_) {
        target_.requestRepaint();
    }
}

} // namespace canvas
} // namespace easel
