#include "easel/runtime/runtime_context.h"
#include "easel/canvas/font.h"
#include "easel/platform/window.h"
#include <iostream>

namespace easel {

static http::HttpOptions fetchOptions(const RuntimeConfig& config) {
    http::HttpOptions options;
    options.timeout = config.httpTimeout;
    options.verifySSL = config.verifySSL;
    return options;
}

RuntimeContext::RuntimeContext(const RuntimeConfig& config)
    : config_(config)
    , lifecycle_(loop_, config_)
    , http_(loop_)
    , files_(loop_)
    , fetcher_(http_, files_, fetchOptions(config_))
    , assets_(fetcher_, config_)
    , audio_(loop_, config_.audioEnabled)
{}

RuntimeContext::~RuntimeContext() {
    shutdown();
}

bool RuntimeContext::init() {
    if (!loop_.init()) {
        std::cerr << "[Easel] Failed to initialize event loop" << std::endl;
        return false;
    }
    return true;
}

void RuntimeContext::shutdown() {
    audio_.close();
    if (video_) {
        video_->shutdown();
    }
    http_.shutdown();
    loop_.shutdown();
}

canvas::FontCatalog& RuntimeContext::fonts() {
    if (!fonts_) {
        fonts_ = std::make_unique<canvas::FontCatalog>();
    }
    return *fonts_;
}

platform::VideoSystem& RuntimeContext::video() {
    if (!video_) {
        video_ = std::make_unique<platform::VideoSystem>(loop_, config_);
    }
    return *video_;
}

} // namespace easel
