#pragma once

/**
 * Audio mixer using SDL3
 *
 * Decoded sounds are converted once to the mixer's format (stereo float,
 * 44.1 kHz). Voices are mixed on SDL's audio thread; when a voice runs out
 * of samples its end notification is posted back to the loop thread.
 */

#include "easel/async/event_loop.h"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

struct SDL_AudioStream;

namespace easel {
namespace audio {

constexpr int kMixerSampleRate = 44100;
constexpr int kMixerChannels = 2;

/**
 * Interleaved stereo float samples at the mixer rate
 */
class SoundBuffer {
public:
    explicit SoundBuffer(std::vector<float> samples);

    size_t frames() const { return samples_.size() / kMixerChannels; }
    const float* data() const { return samples_.data(); }
    double duration() const { return static_cast<double>(frames()) / kMixerSampleRate; }

private:
    std::vector<float> samples_;
};

/**
 * Decode WAV data and convert it to the mixer format.
 * Returns nullptr on failure (the reason is logged).
 */
std::shared_ptr<SoundBuffer> decodeSound(const uint8_t* data, size_t length);

/**
 * Playback position and gain of one sound. Shared with the audio thread.
 */
class Voice {
public:
    explicit Voice(std::shared_ptr<const SoundBuffer> buffer);

    const SoundBuffer& buffer() const { return *buffer_; }

    std::atomic<size_t> position{0};
    std::atomic<float> volume{1.0f};
    // Bumped each time the voice is added to the mixer; an end posted for an
    // older generation is dropped
    std::atomic<uint64_t> generation{0};

    // Runs on the loop thread when the voice reaches the end of its buffer
    // and has not been played again since
    std::function<void()> onEnded;

private:
    std::shared_ptr<const SoundBuffer> buffer_;
};

class AudioMixer {
public:
    explicit AudioMixer(async::EventLoop& loop, bool enabled = true);
    ~AudioMixer();

    /**
     * Open the default playback device. Called lazily by the first play().
     * Idempotent; returns false if no device is available or the mixer was
     * disabled.
     */
    bool open();
    void close();
    bool isOpen() const { return stream_ != nullptr; }

    void play(const std::shared_ptr<Voice>& voice);

    /**
     * Stop mixing the voice, keeping its position.
     */
    void pause(const std::shared_ptr<Voice>& voice);

    bool isActive(const std::shared_ptr<Voice>& voice) const;

    /**
     * Mix numFrames of the active voices into output. Runs on SDL's audio
     * thread; voices that reach their end are removed and their end
     * notification is posted to the loop.
     */
    void mix(float* output, int numFrames);

    AudioMixer(const AudioMixer&) = delete;
    AudioMixer& operator=(const AudioMixer&) = delete;

private:
    static void sdlAudioCallback(void* userdata, SDL_AudioStream* stream, int additionalAmount, int totalAmount);

    async::EventLoop& loop_;
    SDL_AudioStream* stream_ = nullptr;
    bool enabled_;
    bool openFailed_ = false;
    std::atomic<bool> shuttingDown_{false};

    std::vector<std::shared_ptr<Voice>> active_;
    mutable std::mutex voicesMutex_;
    std::vector<float> scratch_;
};

} // namespace audio
} // namespace easel
