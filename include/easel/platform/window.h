#pragma once

/**
 * Window Management (SDL3)
 *
 * VideoSystem owns SDL's video subsystem and pumps its event queue from a
 * loop timer while any window is registered. Each Window is an SDL window
 * with a renderer; its contents are composed from layers, streaming RGBA
 * textures placed at fixed offsets and uploaded by the owner.
 */

#include "easel/async/interval_timer.h"
#include "easel/runtime/config.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

struct SDL_Window;
struct SDL_Renderer;
struct SDL_Texture;

namespace easel {
namespace platform {

constexpr uint64_t kEventPumpIntervalMs = 8;

/**
 * Receives a window's input. Positions are window-relative pixels.
 */
class WindowListener {
public:
    virtual ~WindowListener() = default;

    virtual void onKeyDown(int keyCode) = 0;
    virtual void onKeyUp(int keyCode) = 0;
    virtual void onMouseDown(int x, int y) = 0;
    virtual void onMouseUp(int x, int y) = 0;
    virtual void onMouseMove(int x, int y, bool buttonHeld) = 0;
    // UTF-8 text typed while text input is on
    virtual void onTextInput(const std::string& text) = 0;
    virtual void onCloseRequested() = 0;
    virtual void onExposed() = 0;
};

class VideoSystem {
public:
    VideoSystem(async::EventLoop& loop, const RuntimeConfig& config);
    ~VideoSystem();

    /**
     * Initialize SDL video and events. Idempotent.
     * @return false if SDL refused (no display, no driver)
     */
    bool init();
    void shutdown();
    bool isInitialized() const { return initialized_; }

    void registerWindow(uint32_t windowId, WindowListener* listener);
    void unregisterWindow(uint32_t windowId);
    size_t windowCount() const { return listeners_.size(); }

    /**
     * Drain SDL's queue and hand each event to its window's listener.
     */
    void pumpEvents();

    const RuntimeConfig& config() const { return config_; }

    VideoSystem(const VideoSystem&) = delete;
    VideoSystem& operator=(const VideoSystem&) = delete;

private:
    WindowListener* listenerFor(uint32_t windowId) const;

    const RuntimeConfig& config_;
    async::IntervalTimer pump_;
    std::unordered_map<uint32_t, WindowListener*> listeners_;
    bool initialized_ = false;
};

class Window {
public:
    Window(VideoSystem& video, WindowListener& listener);
    ~Window();

    /**
     * Create the SDL window and its renderer. Hidden when running headless.
     */
    bool create(const std::string& title, int width, int height);
    void destroy();
    bool isOpen() const { return window_ != nullptr; }

    /**
     * Fill colour behind the layers.
     */
    void setChromeColour(uint8_t r, uint8_t g, uint8_t b);

    /**
     * Turn SDL text input events on or off for this window.
     */
    void setTextInput(bool enabled);

    /**
     * Add an RGBA layer at (x, y). Returns its index, or -1 on failure.
     */
    int addLayer(int x, int y, int width, int height);

    /**
     * Upload premultiplied RGBA pixels for a layer.
     */
    bool updateLayer(int index, const uint8_t* pixels, size_t pitch);

    /**
     * Clear to the chrome colour, draw every layer in order, show the result.
     */
    void present();

    uint32_t id() const { return id_; }
    int width() const { return width_; }
    int height() const { return height_; }

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

private:
    struct Layer {
        SDL_Texture* texture = nullptr;
        int x = 0;
        int y = 0;
        int width = 0;
        int height = 0;
    };

    VideoSystem& video_;
    WindowListener& listener_;
    SDL_Window* window_ = nullptr;
    SDL_Renderer* renderer_ = nullptr;
    std::vector<Layer> layers_;
    uint32_t id_ = 0;
    int width_ = 0;
    int height_ = 0;
    uint8_t chrome_[3] = {255, 255, 255};
};

} // namespace platform
} // namespace easel
