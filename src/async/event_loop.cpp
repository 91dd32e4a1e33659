#include "easel/async/event_loop.h"
#include <iostream>
#include <cstring>

namespace easel {
namespace async {

/**
 * One-shot timer owned by the loop until its close callback runs
 */
struct EventLoop::DeferredTask {
    uv_timer_t timer;
    Task task;
    EventLoop* loop = nullptr;

    DeferredTask() {
        memset(&timer, 0, sizeof(timer));
    }
};

EventLoop::EventLoop() {
    memset(&loop_, 0, sizeof(loop_));
    memset(&wakeup_, 0, sizeof(wakeup_));
}

EventLoop::~EventLoop() {
    shutdown();
}

bool EventLoop::init() {
    if (initialized_) {
        return true;
    }

    int result = uv_loop_init(&loop_);
    if (result != 0) {
        std::cerr << "[EventLoop] Failed to initialize libuv loop: "
                  << uv_strerror(result) << std::endl;
        return false;
    }

    result = uv_async_init(&loop_, &wakeup_, onWakeup);
    if (result != 0) {
        std::cerr << "[EventLoop] Failed to initialize wakeup handle: "
                  << uv_strerror(result) << std::endl;
        uv_loop_close(&loop_);
        return false;
    }
    wakeup_.data = this;

    initialized_ = true;
    shuttingDown_ = false;
    return true;
}

void EventLoop::run() {
    if (!initialized_) {
        return;
    }

    // The wakeup handle stays referenced, so this only returns on uv_stop().
    uv_run(&loop_, UV_RUN_DEFAULT);

    if (fault_) {
        std::exception_ptr fault = fault_;
        fault_ = nullptr;
        std::rethrow_exception(fault);
    }
}

void EventLoop::stop() {
    if (initialized_) {
        uv_stop(&loop_);
    }
}

void EventLoop::shutdown() {
    if (!initialized_) {
        return;
    }
    shuttingDown_ = true;

    if (!uv_is_closing(reinterpret_cast<uv_handle_t*>(&wakeup_))) {
        uv_close(reinterpret_cast<uv_handle_t*>(&wakeup_), nullptr);
    }

    // Pending deferred tasks are dropped, not run
    for (DeferredTask* deferred : deferred_) {
        uv_timer_stop(&deferred->timer);
        uv_close(reinterpret_cast<uv_handle_t*>(&deferred->timer), onDeferredClose);
    }
    deferred_.clear();

    {
        std::lock_guard<std::mutex> lock(postedMutex_);
        posted_.clear();
    }

    // Anything still open at this point was leaked by its owner
    int leaked = 0;
    uv_walk(&loop_, [](uv_handle_t* handle, void* arg) {
        if (!uv_is_closing(handle)) {
            uv_close(handle, nullptr);
            ++*static_cast<int*>(arg);
        }
    }, &leaked);
    if (leaked > 0) {
        std::cerr << "[EventLoop] Warning: closed " << leaked
                  << " handle(s) still open at shutdown" << std::endl;
    }

    while (uv_loop_alive(&loop_)) {
        uv_run(&loop_, UV_RUN_ONCE);
    }

    int result = uv_loop_close(&loop_);
    if (result != 0) {
        std::cerr << "[EventLoop] Warning: loop close returned "
                  << uv_strerror(result) << std::endl;
    }

    initialized_ = false;
    fault_ = nullptr;
}

bool EventLoop::defer(Task task, uint64_t delayMs) {
    if (!initialized_ || shuttingDown_) {
        return false;
    }

    auto* deferred = new DeferredTask();
    deferred->task = std::move(task);
    deferred->loop = this;
    deferred->timer.data = deferred;

    int result = uv_timer_init(&loop_, &deferred->timer);
    if (result != 0) {
        std::cerr << "[EventLoop] Failed to create deferred task: "
                  << uv_strerror(result) << std::endl;
        delete deferred;
        return false;
    }

    uv_timer_start(&deferred->timer, onDeferredTimer, delayMs, 0);
    deferred_.insert(deferred);
    return true;
}

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(postedMutex_);
        posted_.push_back(std::move(task));
    }
    if (initialized_ && !shuttingDown_) {
        uv_async_send(&wakeup_);
    }
}

void EventLoop::dispatch(const Task& task) {
    if (fault_ || !task) {
        return;
    }
    try {
        task();
    } catch (...) {
        // Rethrown from run() once libuv has unwound
        fault_ = std::current_exception();
        uv_stop(&loop_);
    }
}

uv_loop_t* EventLoop::handle() {
    if (!initialized_) {
        return nullptr;
    }
    return &loop_;
}

bool EventLoop::isAvailable() const {
    return initialized_ && !shuttingDown_;
}

void EventLoop::onDeferredTimer(uv_timer_t* handle) {
    auto* deferred = static_cast<DeferredTask*>(handle->data);
    EventLoop* loop = deferred->loop;

    loop->deferred_.erase(deferred);
    Task task = std::move(deferred->task);
    uv_close(reinterpret_cast<uv_handle_t*>(handle), onDeferredClose);

    loop->dispatch(task);
}

void EventLoop::onDeferredClose(uv_handle_t* handle) {
    delete static_cast<DeferredTask*>(handle->data);
}

void EventLoop::onWakeup(uv_async_t* handle) {
    static_cast<EventLoop*>(handle->data)->drainPosted();
}

void EventLoop::drainPosted() {
    std::vector<Task> toRun;
    {
        std::lock_guard<std::mutex> lock(postedMutex_);
        std::swap(toRun, posted_);
    }

    for (const auto& task : toRun) {
        dispatch(task);
    }
}

} // namespace async
} // namespace easel
