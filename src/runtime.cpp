/**
 * Runtime implementation
 *
 * Owns the RuntimeContext and every frame, timer and sound the sketch
 * creates. They are disposed before the context shuts the loop down.
 */

#include "easel/runtime.h"
#include "easel/runtime/runtime_context.h"
#include <iostream>
#include <vector>

namespace easel {

class RuntimeImpl : public Runtime {
public:
    explicit RuntimeImpl(const RuntimeConfig& config) : context_(config) {}

    ~RuntimeImpl() override {
        shutdown();
    }

    bool initialize() {
        if (!context_.init()) {
            return false;
        }
        if (context_.config().debug) {
            std::cout << "[Easel] Runtime " << getVersion() << " initialized"
                      << (context_.config().headless ? " (headless)" : "") << std::endl;
        }
        return true;
    }

    void shutdown() {
        for (auto& sound : sounds_) {
            sound->dispose();
        }
        sounds_.clear();
        for (auto& timer : timers_) {
            timer->dispose();
        }
        timers_.clear();
        for (auto& frame : frames_) {
            frame->close();
        }
        frames_.clear();
        context_.shutdown();
    }

    // ========================================================================
    // Sketch API
    // ========================================================================

    Frame& createFrame(const std::string& title, int canvasWidth, int canvasHeight, int controlWidth) override {
        auto frame = std::make_unique<Frame>(context_, title, canvasWidth, canvasHeight, controlWidth);
        frame->open();
        frames_.push_back(std::move(frame));
        return *frames_.back();
    }

    Timer& createTimer(int intervalMs, TimerHandler handler) override {
        timers_.push_back(std::make_unique<Timer>(context_, intervalMs, std::move(handler)));
        return *timers_.back();
    }

    std::shared_ptr<assets::ImageAsset> loadImage(const std::string& url) override {
        return context_.assets().load(url);
    }

    std::shared_ptr<Sound> loadSound(const std::string& url) override {
        auto sound = std::make_shared<Sound>(context_, url);
        sound->load();
        sounds_.push_back(sound);
        return sound;
    }

    // ========================================================================
    // Main Loop
    // ========================================================================

    int exec(const std::function<void(Runtime&)>& setup) override {
        try {
            return context_.lifecycle().run([&]() {
                if (setup) setup(*this);
            });
        } catch (const std::exception& e) {
            std::cerr << "[Easel] Unhandled exception in callback: " << e.what() << std::endl;
            return 1;
        }
    }

    void quit(int exitCode) override {
        context_.lifecycle().exit(exitCode);
    }

    const RuntimeConfig& config() const override {
        return context_.config();
    }

    RuntimeContext& context() override {
        return context_;
    }

private:
    RuntimeContext context_;
    std::vector<std::unique_ptr<Frame>> frames_;
    std::vector<std::unique_ptr<Timer>> timers_;
    std::vector<std::shared_ptr<Sound>> sounds_;
};

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<Runtime> Runtime::create(const RuntimeConfig& config) {
    auto runtime = std::make_unique<RuntimeImpl>(applyEnvironment(config));
    if (!runtime->initialize()) {
        return nullptr;
    }
    return runtime;
}

}  // namespace easel
