#pragma once

/**
 * RenderSurface - periodic draw ticks with change detection
 *
 * Once started, the draw handler is called every drawIntervalMs with a fresh
 * recorder. If the recorded frame buffer differs from the previous one it is
 * kept and exactly one repaint is requested; an identical buffer is dropped.
 * Exceptions from the handler are not caught here.
 */

#include "easel/async/interval_timer.h"
#include "easel/canvas/canvas.h"
#include <cstdint>
#include <functional>
#include <string>

namespace easel {
namespace canvas {

constexpr uint64_t kDefaultDrawIntervalMs = 17;

/**
 * Whatever shows the surface on screen.
 */
class RepaintTarget {
public:
    virtual ~RepaintTarget() = default;
    virtual void requestRepaint() = 0;
};

using DrawHandler = std::function<void(Canvas&)>;

class RenderSurface {
public:
    RenderSurface(async::EventLoop& loop, RepaintTarget& target,
                  uint64_t intervalMs = kDefaultDrawIntervalMs);

    /**
     * Replace the handler and restart the tick schedule if started.
     */
    void setDrawHandler(DrawHandler handler);

    /**
     * Begin ticking. Idempotent.
     */
    void start();

    /**
     * Cancel future ticks for good. A tick in progress finishes.
     */
    void close();

    /**
     * Run one draw cycle now.
     * @return true if the buffer changed and a repaint was requested
     */
    bool tick();

    /**
     * Background fill for repaints; requests a repaint when it changes.
     * @throws ColourParseError
     */
    void setBackground(const std::string& colour);
    const std::string& background() const { return background_; }

    const FrameBuffer& frameBuffer() const { return buffer_; }
    bool isStarted() const { return started_; }
    bool isTicking() const { return timer_.isActive(); }
    uint64_t tickCount() const { return ticks_; }
    uint64_t repaintCount() const { return repaints_; }

private:
    void scheduleTicks();

    RepaintTarget& target_;
    uint64_t intervalMs_;
    async::IntervalTimer timer_;
    DrawHandler handler_;
    FrameBuffer buffer_;
    std::string background_ = "Black";
    bool started_ = false;
    bool closed_ = false;
    uint64_t ticks_ = 0;
    uint64_t repaints_ = 0;
};

} // namespace canvas
} // namespace easel
