#include "easel/runtime/lifecycle.h"
#include <iostream>

namespace easel {

Lifecycle::Lifecycle(async::EventLoop& loop, const RuntimeConfig& config)
    : loop_(loop), config_(config) {}

void Lifecycle::track(const void* resource) {
    bool inserted = tracked_.insert(resource).second;
    if (inserted && config_.debug) {
        std::cout << "[Lifecycle] Tracking " << resource
                  << " (" << tracked_.size() << " live)" << std::endl;
    }
}

void Lifecycle::untrack(const void* resource) {
    size_t removed = tracked_.erase(resource);
    if (removed && config_.debug) {
        std::cout << "[Lifecycle] Untracked " << resource
                  << " (" << tracked_.size() << " live)" << std::endl;
    }
    scheduleQuiescenceCheck();
}

bool Lifecycle::isTracked(const void* resource) const {
    return tracked_.count(resource) != 0;
}

void Lifecycle::windowOpened(const void* window) {
    windows_.insert(window);
}

void Lifecycle::windowClosed(const void* window) {
    windows_.erase(window);
    scheduleQuiescenceCheck();
}

void Lifecycle::scheduleQuiescenceCheck() {
    if (state_ == State::Exited) {
        return;
    }
    if (loop_.defer([this]() {
            pendingChecks_--;
            checkQuiescence();
        }, config_.quiescenceDelayMs)) {
        pendingChecks_++;
    }
}

bool Lifecycle::checkQuiescence() {
    if (state_ != State::Running) {
        return false;
    }
    if (!tracked_.empty() || !windows_.empty()) {
        return false;
    }

    if (config_.debug) {
        std::cout << "[Lifecycle] Nothing left to run, exiting" << std::endl;
    }
    exit(0);
    return true;
}

int Lifecycle::run(const std::function<void()>& setup) {
    if (state_ != State::NotStarted) {
        std::cerr << "[Lifecycle] run() called more than once" << std::endl;
        return -1;
    }

    if (setup) {
        setup();
    }
    if (state_ == State::Exited) {
        // exit() from inside setup
        return exitCode_;
    }

    state_ = State::Running;
    // A sketch that registered nothing exits right away
    scheduleQuiescenceCheck();

    try {
        loop_.run();
    } catch (...) {
        state_ = State::Exited;
        throw;
    }

    state_ = State::Exited;
    return exitCode_;
}

void Lifecycle::exit(int code) {
    if (state_ == State::Exited) {
        return;
    }
    state_ = State::Exited;
    exitCode_ = code;
    loop_.stop();
}

} // namespace easel
