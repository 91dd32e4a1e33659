#pragma once

/**
 * IntervalTimer - repeating libuv timer owned by a C++ object
 *
 * The uv handle lives in a heap context that is freed by the close callback,
 * so the owner may be destroyed (or close the timer) from inside its own tick.
 */

#include "easel/async/event_loop.h"
#include <cstdint>

namespace easel {
namespace async {

class IntervalTimer {
public:
    explicit IntervalTimer(EventLoop& loop);
    ~IntervalTimer();

    /**
     * Start (or restart) the timer; the first tick fires after intervalMs.
     * @return false if the loop is unavailable or the timer was closed
     */
    bool start(uint64_t intervalMs, Task onTick);

    /**
     * Cancel future ticks. A tick already running is not interrupted.
     */
    void stop();

    bool isActive() const { return active_; }

    /**
     * Release the libuv handle. start() fails afterwards.
     */
    void close();

    IntervalTimer(const IntervalTimer&) = delete;
    IntervalTimer& operator=(const IntervalTimer&) = delete;

private:
    struct Context;

    static void onTick(uv_timer_t* handle);
    static void onClose(uv_handle_t* handle);

    EventLoop& loop_;
    Context* ctx_ = nullptr;
    bool active_ = false;
    bool closed_ = false;
};

} // namespace async
} // namespace easel
