#pragma once

#include "easel/assets/image_asset.h"
#include "easel/runtime/config.h"
#include "easel/runtime/control_panel.h"
#include "easel/runtime/frame.h"
#include "easel/runtime/sound.h"
#include "easel/runtime/timer.h"
#include <functional>
#include <memory>
#include <string>

namespace easel {

class RuntimeContext;

/**
 * Easel Runtime
 *
 * Hosts one sketch: the setup function creates frames, timers, images and
 * sounds, then the runtime runs the event loop until none of them has
 * anything left to do.
 *
 * Example usage:
 *   auto runtime = easel::Runtime::create();
 *   return runtime->exec([](easel::Runtime& rt) {
 *       auto& frame = rt.createFrame("Home", 300, 200);
 *       frame.setDrawHandler([](easel::canvas::Canvas& canvas) {
 *           canvas.drawText("Hello", {100, 100}, 24, "White");
 *       });
 *       frame.start();
 *   });
 *
 * Frames and timers are owned by the runtime and live until it is destroyed.
 */
class Runtime {
public:
    /**
     * Create a new runtime instance. EASEL_* environment variables override
     * the matching config fields.
     * @return Unique pointer to the runtime, or nullptr on failure
     */
    static std::unique_ptr<Runtime> create(const RuntimeConfig& config = {});

    virtual ~Runtime() = default;

    // ========================================================================
    // Sketch API
    // ========================================================================

    /**
     * Create and show a frame.
     * @throws ArgumentError for a non-positive canvas size
     */
    virtual Frame& createFrame(const std::string& title, int canvasWidth, int canvasHeight,
                               int controlWidth = kDefaultControlWidth) = 0;

    /**
     * Create a stopped timer.
     * @throws ArgumentError unless intervalMs > 0
     */
    virtual Timer& createTimer(int intervalMs, TimerHandler handler) = 0;

    /**
     * Start loading an image. Never throws; check isReady() / width().
     */
    virtual std::shared_ptr<assets::ImageAsset> loadImage(const std::string& url) = 0;

    /**
     * Start loading a sound. Never throws; check isLoaded().
     */
    virtual std::shared_ptr<Sound> loadSound(const std::string& url) = 0;

    // ========================================================================
    // Main Loop
    // ========================================================================

    /**
     * Run setup, then the loop until nothing is left to do or quit().
     * An exception escaping setup or a callback is logged and gives exit code 1.
     * @return Exit code
     */
    virtual int exec(const std::function<void(Runtime&)>& setup) = 0;

    /**
     * Leave the loop at the end of the current callback.
     */
    virtual void quit(int exitCode = 0) = 0;

    virtual const RuntimeConfig& config() const = 0;

    /**
     * Services shared by the runtime's components (advanced use)
     */
    virtual RuntimeContext& context() = 0;

protected:
    Runtime() = default;
};

// Version info - uses CMake-defined EASEL_VERSION
#ifndef EASEL_VERSION
#define EASEL_VERSION "0.1.0"
#endif

inline const char* getVersion() {
    return EASEL_VERSION;
}

}  // namespace easel
