#include "easel/async/interval_timer.h"
#include <iostream>
#include <cstring>

namespace easel {
namespace async {

struct IntervalTimer::Context {
    uv_timer_t timer;
    Task onTick;
    EventLoop* loop = nullptr;

    Context() {
        memset(&timer, 0, sizeof(timer));
    }
};

IntervalTimer::IntervalTimer(EventLoop& loop) : loop_(loop) {}

IntervalTimer::~IntervalTimer() {
    close();
}

bool IntervalTimer::start(uint64_t intervalMs, Task onTick) {
    if (closed_ || !loop_.isAvailable()) {
        return false;
    }

    if (!ctx_) {
        auto* ctx = new Context();
        ctx->loop = &loop_;
        ctx->timer.data = ctx;
        int result = uv_timer_init(loop_.handle(), &ctx->timer);
        if (result != 0) {
            std::cerr << "[Timer] uv_timer_init failed: " << uv_strerror(result) << std::endl;
            delete ctx;
            return false;
        }
        ctx_ = ctx;
    }

    ctx_->onTick = std::move(onTick);
    uv_timer_start(&ctx_->timer, IntervalTimer::onTick, intervalMs, intervalMs);
    active_ = true;
    return true;
}

void IntervalTimer::stop() {
    if (ctx_) {
        uv_timer_stop(&ctx_->timer);
    }
    active_ = false;
}

void IntervalTimer::close() {
    active_ = false;
    closed_ = true;
    if (!ctx_) {
        return;
    }

    auto* handle = reinterpret_cast<uv_handle_t*>(&ctx_->timer);
    if (!loop_.handle()) {
        // The loop's shutdown already closed the handle
        delete ctx_;
    } else if (!uv_is_closing(handle)) {
        uv_timer_stop(&ctx_->timer);
        uv_close(handle, onClose);
    }
    ctx_ = nullptr;
}

void IntervalTimer::onTick(uv_timer_t* handle) {
    auto* ctx = static_cast<Context*>(handle->data);
    // Copy so the handler survives a restart from inside itself
    Task task = ctx->onTick;
    ctx->loop->dispatch(task);
}

void IntervalTimer::onClose(uv_handle_t* handle) {
    delete static_cast<Context*>(handle->data);
}

} // namespace async
} // namespace easel
