#pragma once

/**
 * Timer - a repeating sketch timer
 *
 * A running timer keeps the program alive. stop() releases it and lets the
 * lifecycle check whether anything else is left.
 */

#include "easel/async/interval_timer.h"
#include <functional>

namespace easel {

class RuntimeContext;

using TimerHandler = std::function<void()>;

class Timer {
public:
    /**
     * @throws ArgumentError unless intervalMs > 0
     */
    Timer(RuntimeContext& context, int intervalMs, TimerHandler handler);
    ~Timer();

    /**
     * Start, or restart from a full interval if already running.
     */
    void start();
    void stop();
    bool isRunning() const { return running_; }
    int interval() const { return intervalMs_; }

    /**
     * Stop for good and release the libuv handle.
     */
    void dispose();

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

private:
    RuntimeContext& context_;
    int intervalMs_;
    TimerHandler handler_;
    async::IntervalTimer timer_;
    bool running_ = false;
};

} // namespace easel
