#pragma once

/**
 * Sound - a sound loaded from a URL
 *
 * Loading starts at creation and keeps the program alive until it finishes.
 * A play() issued while loading is honoured once the data arrives. A playing
 * sound stays tracked until it is paused, rewound or reaches its end. Load
 * and decode failures are silent: isLoaded() stays false.
 */

#include "easel/audio/audio_mixer.h"
#include <memory>
#include <string>

namespace easel {

class RuntimeContext;

class Sound : public std::enable_shared_from_this<Sound> {
public:
    Sound(RuntimeContext& context, std::string url);
    ~Sound();

    /**
     * Start the fetch. Called once by the runtime right after construction.
     */
    void load();

    /**
     * Start playing, or resume from the paused position.
     */
    void play();

    /**
     * Stop playing and keep the position.
     */
    void pause();

    /**
     * Stop playing; the next play() starts from the beginning.
     */
    void rewind();

    /**
     * @throws ArgumentError unless 0 <= volume <= 1
     */
    void setVolume(double volume);
    double volume() const { return volume_; }

    const std::string& url() const { return url_; }
    bool isLoaded() const { return loaded_; }
    bool isLoading() const { return loading_; }
    bool isPlaying() const;
    const std::string& errorMessage() const { return error_; }

    /**
     * Stop playback and drop any pending load result.
     */
    void dispose();

    Sound(const Sound&) = delete;
    Sound& operator=(const Sound&) = delete;

private:
    void onFetched(std::vector<uint8_t> data, std::string error);
    void onEnded();

    RuntimeContext& context_;
    std::string url_;
    std::shared_ptr<audio::Voice> voice_;
    std::string error_;
    double volume_ = 1.0;
    bool loading_ = false;
    bool loaded_ = false;
    bool playRequested_ = false;
    bool disposed_ = false;
};

} // namespace easel
