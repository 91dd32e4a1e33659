#pragma once

/**
 * Lifecycle - keeps the loop running until nothing is left to do
 *
 * Timers, sounds and frames register here while they are live. Unregistering
 * one (or closing the last window) schedules a quiescence check on the loop;
 * the check re-reads both sets when it runs and stops the loop if they are
 * empty. Registering never triggers a check, so a resource that starts a
 * successor from inside its own stop keeps the program alive.
 *
 * All calls happen on the loop thread.
 */

#include "easel/async/event_loop.h"
#include "easel/runtime/config.h"
#include <cstddef>
#include <functional>
#include <unordered_set>

namespace easel {

class Lifecycle {
public:
    enum class State { NotStarted, Running, Exited };

    Lifecycle(async::EventLoop& loop, const RuntimeConfig& config);

    // ========================================================================
    // Resource tracking
    // ========================================================================

    void track(const void* resource);
    void untrack(const void* resource);
    bool isTracked(const void* resource) const;
    size_t trackedCount() const { return tracked_.size(); }

    void windowOpened(const void* window);
    void windowClosed(const void* window);
    size_t openWindowCount() const { return windows_.size(); }

    // ========================================================================
    // Exit condition
    // ========================================================================

    /**
     * Schedule a check for the near future. Never runs the check inline.
     */
    void scheduleQuiescenceCheck();

    /**
     * Run the check now. Returns true if the lifecycle exited.
     */
    bool checkQuiescence();

    /**
     * Run setup, then the loop until quiescence or exit().
     * NotStarted -> Running happens once; a second call returns -1.
     * Exceptions from setup or from loop callbacks propagate.
     * @return exit code (0 on quiescence)
     */
    int run(const std::function<void()>& setup);

    /**
     * Leave the loop with the given exit code.
     */
    void exit(int code);

    State state() const { return state_; }
    int pendingChecks() const { return pendingChecks_; }

private:
    async::EventLoop& loop_;
    const RuntimeConfig& config_;
    State state_ = State::NotStarted;
    int exitCode_ = 0;
    int pendingChecks_ = 0;

    std::unordered_set<const void*> tracked_;
    std::unordered_set<const void*> windows_;
};

} // namespace easel
