/**
 * Window Management (SDL3)
 *
 * Handles SDL video setup, window creation, layer composition and event
 * dispatch to the window that owns each event.
 */

#include "easel/platform/window.h"
#include "easel/input/keys.h"
#include <SDL3/SDL.h>
#include <iostream>

namespace easel {
namespace platform {

// ============================================================================
// VideoSystem
// ============================================================================

VideoSystem::VideoSystem(async::EventLoop& loop, const RuntimeConfig& config)
    : config_(config), pump_(loop) {}

VideoSystem::~VideoSystem() {
    shutdown();
}

bool VideoSystem::init() {
    if (initialized_) return true;

    if (!SDL_InitSubSystem(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        std::cerr << "[Window] SDL_InitSubSystem failed: " << SDL_GetError() << std::endl;
        return false;
    }
    if (config_.debug) {
        std::cout << "[Window] SDL video initialized (" << SDL_GetCurrentVideoDriver() << ")" << std::endl;
    }
    initialized_ = true;
    return true;
}

void VideoSystem::shutdown() {
    pump_.close();
    listeners_.clear();
    if (!initialized_) return;

    // SDL_Quit() is skipped: the audio subsystem is released separately
    SDL_QuitSubSystem(SDL_INIT_VIDEO | SDL_INIT_EVENTS);
    initialized_ = false;
}

void VideoSystem::registerWindow(uint32_t windowId, WindowListener* listener) {
    listeners_[windowId] = listener;
    if (!pump_.isActive()) {
        pump_.start(kEventPumpIntervalMs, [this]() { pumpEvents(); });
    }
}

void VideoSystem::unregisterWindow(uint32_t windowId) {
    listeners_.erase(windowId);
    if (listeners_.empty()) {
        pump_.stop();
    }
}

WindowListener* VideoSystem::listenerFor(uint32_t windowId) const {
    auto it = listeners_.find(windowId);
    return it != listeners_.end() ? it->second : nullptr;
}

void VideoSystem::pumpEvents() {
    if (!initialized_) return;

    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        switch (event.type) {
            case SDL_EVENT_QUIT: {
                // Copy first: listeners unregister while closing
                std::vector<WindowListener*> all;
                for (const auto& entry : listeners_) {
                    all.push_back(entry.second);
                }
                for (WindowListener* listener : all) {
                    listener->onCloseRequested();
                }
                break;
            }

            case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
                if (auto* listener = listenerFor(event.window.windowID)) {
                    listener->onCloseRequested();
                }
                break;

            case SDL_EVENT_WINDOW_EXPOSED:
                if (auto* listener = listenerFor(event.window.windowID)) {
                    listener->onExposed();
                }
                break;

            case SDL_EVENT_KEY_DOWN:
            case SDL_EVENT_KEY_UP: {
                if (event.key.repeat) break;
                auto* listener = listenerFor(event.key.windowID);
                int code = input::legacyKeyCode(event.key.key);
                if (!listener || code < 0) break;
                if (event.type == SDL_EVENT_KEY_DOWN) {
                    listener->onKeyDown(code);
                } else {
                    listener->onKeyUp(code);
                }
                break;
            }

            case SDL_EVENT_MOUSE_BUTTON_DOWN:
            case SDL_EVENT_MOUSE_BUTTON_UP: {
                auto* listener = listenerFor(event.button.windowID);
                if (!listener) break;
                int x = static_cast<int>(event.button.x);
                int y = static_cast<int>(event.button.y);
                if (event.type == SDL_EVENT_MOUSE_BUTTON_DOWN) {
                    listener->onMouseDown(x, y);
                } else {
                    listener->onMouseUp(x, y);
                }
                break;
            }

            case SDL_EVENT_TEXT_INPUT:
                if (auto* listener = listenerFor(event.text.windowID)) {
                    if (event.text.text) {
                        listener->onTextInput(event.text.text);
                    }
                }
                break;

            case SDL_EVENT_MOUSE_MOTION:
                if (auto* listener = listenerFor(event.motion.windowID)) {
                    listener->onMouseMove(static_cast<int>(event.motion.x), static_cast<int>(event.motion.y),
                                          event.motion.state != 0);
                }
                break;

            default:
                break;
        }
    }
}

// ============================================================================
// Window
// ============================================================================

Window::Window(VideoSystem& video, WindowListener& listener) : video_(video), listener_(listener) {}

Window::~Window() {
    destroy();
}

bool Window::create(const std::string& title, int width, int height) {
    if (window_) return true;
    if (!video_.init()) return false;

    SDL_WindowFlags flags = 0;
    if (video_.config().headless) {
        flags |= SDL_WINDOW_HIDDEN;
    }

    window_ = SDL_CreateWindow(title.c_str(), width, height, flags);
    if (!window_) {
        std::cerr << "[Window] SDL_CreateWindow failed: " << SDL_GetError() << std::endl;
        return false;
    }

    renderer_ = SDL_CreateRenderer(window_, nullptr);
    if (!renderer_) {
        std::cerr << "[Window] SDL_CreateRenderer failed: " << SDL_GetError() << std::endl;
        SDL_DestroyWindow(window_);
        window_ = nullptr;
        return false;
    }

    id_ = SDL_GetWindowID(window_);
    width_ = width;
    height_ = height;
    video_.registerWindow(id_, &listener_);

    if (video_.config().debug) {
        std::cout << "[Window] Created " << title << " (" << width << "x" << height << ")" << std::endl;
    }
    return true;
}

void Window::destroy() {
    if (!window_) return;

    video_.unregisterWindow(id_);

    for (auto& layer : layers_) {
        if (layer.texture) {
            SDL_DestroyTexture(layer.texture);
        }
    }
    layers_.clear();

    if (renderer_) {
        SDL_DestroyRenderer(renderer_);
        renderer_ = nullptr;
    }
    SDL_DestroyWindow(window_);
    window_ = nullptr;
    id_ = 0;
}

void Window::setTextInput(bool enabled) {
    if (!window_) return;
    bool ok = enabled ? SDL_StartTextInput(window_) : SDL_StopTextInput(window_);
    if (!ok) {
        std::cerr << "[Window] Cannot " << (enabled ? "start" : "stop") << " text input: " << SDL_GetError()
                  << std::endl;
    }
}

void Window::setChromeColour(uint8_t r, uint8_t g, uint8_t b) {
    chrome_[0] = r;
    chrome_[1] = g;
    chrome_[2] = b;
}

int Window::addLayer(int x, int y, int width, int height) {
    if (!renderer_) return -1;

    SDL_Texture* texture = SDL_CreateTexture(renderer_, SDL_PIXELFORMAT_RGBA32, SDL_TEXTUREACCESS_STREAMING,
                                             width, height);
    if (!texture) {
        std::cerr << "[Window] SDL_CreateTexture failed: " << SDL_GetError() << std::endl;
        return -1;
    }
    SDL_SetTextureBlendMode(texture, SDL_BLENDMODE_BLEND_PREMULTIPLIED);

    layers_.push_back({texture, x, y, width, height});
    return static_cast<int>(layers_.size()) - 1;
}

bool Window::updateLayer(int index, const uint8_t* pixels, size_t pitch) {
    if (index < 0 || index >= static_cast<int>(layers_.size())) return false;

    if (!SDL_UpdateTexture(layers_[index].texture, nullptr, pixels, static_cast<int>(pitch))) {
        std::cerr << "[Window] SDL_UpdateTexture failed: " << SDL_GetError() << std::endl;
        return false;
    }
    return true;
}

void Window::present() {
    if (!renderer_) return;

    SDL_SetRenderDrawColor(renderer_, chrome_[0], chrome_[1], chrome_[2], 255);
    SDL_RenderClear(renderer_);

    for (const auto& layer : layers_) {
        SDL_FRect dest;
        dest.x = static_cast<float>(layer.x);
        dest.y = static_cast<float>(layer.y);
        dest.w = static_cast<float>(layer.width);
        dest.h = static_cast<float>(layer.height);
        SDL_RenderTexture(renderer_, layer.texture, nullptr, &dest);
    }

    SDL_RenderPresent(renderer_);
}

} // namespace platform
} // namespace easel
