#pragma once

/**
 * EventLoop - the libuv loop that drives a sketch
 *
 * Every timer fire, draw tick, I/O completion and deferred check runs as a
 * callback on this loop, on the thread that called run().
 *
 * Usage:
 *   1. Call init() once
 *   2. Schedule work with defer() or post()
 *   3. Call run(); it returns after stop()
 *   4. Call shutdown() to close the remaining handles
 *
 * Callbacks that invoke user code go through dispatch(). An exception that
 * escapes one of them stops the loop and is rethrown from run(), so it never
 * unwinds through libuv's C frames.
 */

#include <uv.h>

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <unordered_set>
#include <vector>

namespace easel {
namespace async {

using Task = std::function<void()>;

class EventLoop {
public:
    EventLoop();
    ~EventLoop();

    /**
     * Initialize the libuv loop and the cross-thread wakeup handle.
     * Safe to call multiple times (idempotent).
     * @return false if libuv refused to initialize
     */
    bool init();

    /**
     * Run the loop until stop() is called or a callback faults.
     * Rethrows the first exception that escaped a dispatched callback.
     */
    void run();

    /**
     * Ask run() to return at the end of the current iteration.
     */
    void stop();

    /**
     * Close every handle and the loop itself.
     * Safe to call multiple times (idempotent).
     */
    void shutdown();

    /**
     * Schedule a one-shot task on the loop after delayMs.
     * A delay of 0 runs the task on the next iteration, never inline.
     * @return false if the loop is not running or is shutting down
     */
    bool defer(Task task, uint64_t delayMs = 0);

    /**
     * Queue a task from any thread; it runs on the loop thread.
     */
    void post(Task task);

    /**
     * Run a callback at the fault boundary.
     */
    void dispatch(const Task& task);

    uv_loop_t* handle();
    bool isAvailable() const;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

private:
    struct DeferredTask;

    static void onDeferredTimer(uv_timer_t* handle);
    static void onDeferredClose(uv_handle_t* handle);
    static void onWakeup(uv_async_t* handle);

    void drainPosted();

    uv_loop_t loop_;
    uv_async_t wakeup_;
    // Read by post() from other threads
    std::atomic<bool> initialized_{false};
    std::atomic<bool> shuttingDown_{false};

    std::unordered_set<DeferredTask*> deferred_;

    std::mutex postedMutex_;
    std::vector<Task> posted_;

    std::exception_ptr fault_;
};

} // namespace async
} // namespace easel
