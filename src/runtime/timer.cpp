#include "easel/runtime/timer.h"
#include "easel/errors.h"
#include "easel/runtime/runtime_context.h"
#include <iostream>

namespace easel {

Timer::Timer(RuntimeContext& context, int intervalMs, TimerHandler handler)
    : context_(context), intervalMs_(intervalMs), handler_(std::move(handler)), timer_(context.loop())
{
    if (intervalMs <= 0) {
        throw ArgumentError("Timer interval must be positive, got " + std::to_string(intervalMs));
    }
    if (!handler_) {
        throw ArgumentError("Timer handler must not be empty");
    }
}

Timer::~Timer() {
    dispose();
}

void Timer::start() {
    bool ok = timer_.start(static_cast<uint64_t>(intervalMs_), [this]() { handler_(); });
    if (!ok) {
        std::cerr << "[Timer] Failed to start timer" << std::endl;
        return;
    }
    running_ = true;
    context_.lifecycle().track(this);
}

void Timer::stop() {
    timer_.stop();
    running_ = false;
    context_.lifecycle().untrack(this);
}

void Timer::dispose() {
    timer_.close();
    if (running_) {
        running_ = false;
        context_.lifecycle().untrack(this);
    }
}

} // namespace easel
