#pragma once

/**
 * RuntimeContext - the services a sketch runs on
 *
 * One context per runtime, passed by reference to every component that
 * needs the loop, the lifecycle or an I/O service. Members are declared in
 * dependency order so they are torn down in reverse.
 */

#include "easel/assets/asset_cache.h"
#include "easel/assets/fetcher.h"
#include "easel/async/event_loop.h"
#include "easel/audio/audio_mixer.h"
#include "easel/fs/async_file.h"
#include "easel/http/async_http_client.h"
#include "easel/runtime/config.h"
#include "easel/runtime/lifecycle.h"
#include <memory>

namespace easel {

namespace canvas {
class FontCatalog;
}
namespace platform {
class VideoSystem;
}

class RuntimeContext {
public:
    explicit RuntimeContext(const RuntimeConfig& config = {});
    ~RuntimeContext();

    /**
     * Initialize the event loop. Everything else starts lazily.
     */
    bool init();

    /**
     * Release audio, windows, transfers and finally the loop.
     */
    void shutdown();

    const RuntimeConfig& config() const { return config_; }
    async::EventLoop& loop() { return loop_; }
    Lifecycle& lifecycle() { return lifecycle_; }
    http::AsyncHttpClient& http() { return http_; }
    fs::AsyncFileReader& files() { return files_; }
    assets::Fetcher& fetcher() { return fetcher_; }
    assets::AssetCache& assets() { return assets_; }
    audio::AudioMixer& audio() { return audio_; }
    canvas::FontCatalog& fonts();
    platform::VideoSystem& video();

    RuntimeContext(const RuntimeContext&) = delete;
    RuntimeContext& operator=(const RuntimeContext&) = delete;

private:
    RuntimeConfig config_;
    async::EventLoop loop_;
    Lifecycle lifecycle_;
    http::AsyncHttpClient http_;
    fs::AsyncFileReader files_;
    assets::Fetcher fetcher_;
    assets::AssetCache assets_;
    audio::AudioMixer audio_;
    std::unique_ptr<canvas::FontCatalog> fonts_;
    std::unique_ptr<platform::VideoSystem> video_;
};

} // namespace easel
