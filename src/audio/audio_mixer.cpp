/**
 * Audio mixer using SDL3
 */

#include "easel/audio/audio_mixer.h"
#include <SDL3/SDL.h>
#include <algorithm>
#include <cstring>
#include <iostream>

namespace easel {
namespace audio {

// ============================================================================
// SoundBuffer / Voice
// ============================================================================

SoundBuffer::SoundBuffer(std::vector<float> samples) : samples_(std::move(samples)) {}

Voice::Voice(std::shared_ptr<const SoundBuffer> buffer) : buffer_(std::move(buffer)) {}

// ============================================================================
// Decoding
// ============================================================================

std::shared_ptr<SoundBuffer> decodeSound(const uint8_t* data, size_t length) {
    SDL_IOStream* io = SDL_IOFromConstMem(data, length);
    if (!io) {
        std::cerr << "[Audio] Failed to create IO stream: " << SDL_GetError() << std::endl;
        return nullptr;
    }

    SDL_AudioSpec spec;
    uint8_t* audioData = nullptr;
    uint32_t audioLen = 0;

    // closeio = true: the stream is released even on failure
    if (!SDL_LoadWAV_IO(io, true, &spec, &audioData, &audioLen)) {
        std::cerr << "[Audio] Failed to load audio: " << SDL_GetError() << std::endl;
        return nullptr;
    }

    SDL_AudioSpec target;
    target.format = SDL_AUDIO_F32;
    target.channels = kMixerChannels;
    target.freq = kMixerSampleRate;

    uint8_t* converted = nullptr;
    int convertedLen = 0;
    bool ok = SDL_ConvertAudioSamples(&spec, audioData, static_cast<int>(audioLen),
                                      &target, &converted, &convertedLen);
    SDL_free(audioData);
    if (!ok) {
        std::cerr << "[Audio] Failed to convert audio: " << SDL_GetError() << std::endl;
        return nullptr;
    }

    std::vector<float> samples(static_cast<size_t>(convertedLen) / sizeof(float));
    std::memcpy(samples.data(), converted, samples.size() * sizeof(float));
    SDL_free(converted);

    return std::make_shared<SoundBuffer>(std::move(samples));
}

// ============================================================================
// AudioMixer
// ============================================================================

AudioMixer::AudioMixer(async::EventLoop& loop, bool enabled) : loop_(loop), enabled_(enabled) {}

AudioMixer::~AudioMixer() {
    close();
}

bool AudioMixer::open() {
    if (stream_) return true;
    if (openFailed_) return false;

    if (!enabled_) {
        std::cout << "[Audio] Playback disabled" << std::endl;
        openFailed_ = true;
        return false;
    }

    if (!SDL_WasInit(SDL_INIT_AUDIO)) {
        if (!SDL_InitSubSystem(SDL_INIT_AUDIO)) {
            std::cerr << "[Audio] Failed to init SDL audio: " << SDL_GetError() << std::endl;
            openFailed_ = true;
            return false;
        }
    }

    SDL_AudioSpec spec;
    spec.freq = kMixerSampleRate;
    spec.format = SDL_AUDIO_F32;
    spec.channels = kMixerChannels;

    stream_ = SDL_OpenAudioDeviceStream(SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK, &spec, sdlAudioCallback, this);
    if (!stream_) {
        std::cerr << "[Audio] Failed to open audio device: " << SDL_GetError() << std::endl;
        openFailed_ = true;
        return false;
    }

    shuttingDown_.store(false, std::memory_order_release);
    SDL_ResumeAudioStreamDevice(stream_);
    return true;
}

void AudioMixer::close() {
    if (!stream_) return;

    shuttingDown_.store(true, std::memory_order_release);

    // SDL waits for a running callback to finish
    SDL_DestroyAudioStream(stream_);
    stream_ = nullptr;

    std::lock_guard<std::mutex> lock(voicesMutex_);
    active_.clear();
}

void AudioMixer::play(const std::shared_ptr<Voice>& voice) {
    if (!voice || !open()) return;

    std::lock_guard<std::mutex> lock(voicesMutex_);
    if (std::find(active_.begin(), active_.end(), voice) == active_.end()) {
        voice->generation.fetch_add(1, std::memory_order_relaxed);
        active_.push_back(voice);
    }
}

void AudioMixer::pause(const std::shared_ptr<Voice>& voice) {
    std::lock_guard<std::mutex> lock(voicesMutex_);
    active_.erase(std::remove(active_.begin(), active_.end(), voice), active_.end());
}

bool AudioMixer::isActive(const std::shared_ptr<Voice>& voice) const {
    std::lock_guard<std::mutex> lock(voicesMutex_);
    return std::find(active_.begin(), active_.end(), voice) != active_.end();
}

// Audio thread
void AudioMixer::mix(float* output, int numFrames) {
    std::memset(output, 0, static_cast<size_t>(numFrames) * kMixerChannels * sizeof(float));

    struct Finished {
        std::shared_ptr<Voice> voice;
        uint64_t generation;
    };
    std::vector<Finished> finished;
    {
        std::lock_guard<std::mutex> lock(voicesMutex_);
        for (auto& voice : active_) {
            const SoundBuffer& buffer = voice->buffer();
            size_t position = voice->position.load(std::memory_order_relaxed);
            size_t available = buffer.frames() > position ? buffer.frames() - position : 0;
            size_t count = std::min(available, static_cast<size_t>(numFrames));
            float gain = voice->volume.load(std::memory_order_relaxed);

            const float* src = buffer.data() + position * kMixerChannels;
            for (size_t i = 0; i < count * kMixerChannels; i++) {
                output[i] += src[i] * gain;
            }

            position += count;
            if (position >= buffer.frames()) {
                // Played to the end: the next play starts over
                voice->position.store(0, std::memory_order_relaxed);
                finished.push_back({voice, voice->generation.load(std::memory_order_relaxed)});
            } else {
                voice->position.store(position, std::memory_order_relaxed);
            }
        }

        for (const auto& done : finished) {
            active_.erase(std::remove(active_.begin(), active_.end(), done.voice), active_.end());
        }
    }

    for (int i = 0; i < numFrames * kMixerChannels; i++) {
        output[i] = std::clamp(output[i], -1.0f, 1.0f);
    }

    for (const auto& done : finished) {
        std::weak_ptr<Voice> weak = done.voice;
        uint64_t generation = done.generation;
        loop_.post([weak, generation]() {
            auto v = weak.lock();
            // Played again before this ran: the new playback owns the end
            if (!v || v->generation.load(std::memory_order_relaxed) != generation) return;
            if (v->onEnded) {
                v->onEnded();
            }
        });
    }
}

void AudioMixer::sdlAudioCallback(void* userdata, SDL_AudioStream* stream, int additionalAmount, int totalAmount) {
    auto* mixer = static_cast<AudioMixer*>(userdata);
    if (additionalAmount <= 0) return;

    int numFrames = additionalAmount / static_cast<int>(kMixerChannels * sizeof(float));
    mixer->scratch_.resize(static_cast<size_t>(numFrames) * kMixerChannels);

    // No I/O in here; shutting down only needs silence
    if (mixer->shuttingDown_.load(std::memory_order_acquire)) {
        std::fill(mixer->scratch_.begin(), mixer->scratch_.end(), 0.0f);
    } else {
        mixer->mix(mixer->scratch_.data(), numFrames);
    }

    SDL_PutAudioStreamData(stream, mixer->scratch_.data(), numFrames * kMixerChannels * static_cast<int>(sizeof(float)));
}

} // namespace audio
} // namespace easel
