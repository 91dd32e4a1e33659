#include "easel/runtime/sound.h"
#include "easel/errors.h"
#include "easel/runtime/runtime_context.h"
#include <iostream>

namespace easel {

Sound::Sound(RuntimeContext& context, std::string url) : context_(context), url_(std::move(url)) {}

Sound::~Sound() {
    dispose();
}

void Sound::load() {
    if (loading_ || loaded_ || disposed_) return;

    loading_ = true;
    context_.lifecycle().track(this);

    std::weak_ptr<Sound> weak = shared_from_this();
    context_.fetcher().fetch(url_, [weak](std::vector<uint8_t> data, std::string error) {
        if (auto sound = weak.lock()) {
            sound->onFetched(std::move(data), std::move(error));
        }
    });
}

void Sound::onFetched(std::vector<uint8_t> data, std::string error) {
    if (disposed_) return;
    loading_ = false;

    if (error.empty()) {
        auto buffer = audio::decodeSound(data.data(), data.size());
        if (buffer) {
            voice_ = std::make_shared<audio::Voice>(std::move(buffer));
            voice_->volume.store(static_cast<float>(volume_));

            std::weak_ptr<Sound> weak = shared_from_this();
            voice_->onEnded = [weak]() {
                if (auto sound = weak.lock()) {
                    sound->onEnded();
                }
            };
            loaded_ = true;
        } else {
            error_ = "Unsupported sound data: " + url_;
        }
    } else {
        error_ = std::move(error);
    }

    if (!loaded_) {
        std::cerr << "[Audio] Failed to load " << url_ << ": " << error_ << std::endl;
    } else if (context_.config().debug) {
        std::cout << "[Audio] Loaded " << url_ << " (" << voice_->buffer().duration() << "s)" << std::endl;
    }

    if (loaded_ && playRequested_) {
        play();
        return;
    }
    playRequested_ = false;
    context_.lifecycle().untrack(this);
}

void Sound::play() {
    if (disposed_) return;

    if (loaded_) {
        if (!context_.audio().open()) {
            std::cerr << "[Audio] No playback device, " << url_ << " not played" << std::endl;
            playRequested_ = false;
            context_.lifecycle().untrack(this);
            return;
        }
        context_.audio().play(voice_);
        context_.lifecycle().track(this);
    }
    playRequested_ = true;
}

void Sound::pause() {
    if (loaded_) {
        context_.audio().pause(voice_);
        context_.lifecycle().untrack(this);
    }
    playRequested_ = false;
}

void Sound::rewind() {
    if (loaded_) {
        context_.audio().pause(voice_);
        voice_->position.store(0);
        context_.lifecycle().untrack(this);
    }
    playRequested_ = false;
}

void Sound::setVolume(double volume) {
    if (!(volume >= 0.0 && volume <= 1.0)) {
        throw ArgumentError("Volume must be in the range 0-1, got " + std::to_string(volume));
    }
    volume_ = volume;
    if (voice_) {
        voice_->volume.store(static_cast<float>(volume));
    }
}

bool Sound::isPlaying() const {
    return loaded_ && context_.audio().isActive(voice_);
}

void Sound::onEnded() {
    if (disposed_ || context_.audio().isActive(voice_)) return;
    playRequested_ = false;
    context_.lifecycle().untrack(this);
}

void Sound::dispose() {
    if (disposed_) return;
    disposed_ = true;

    if (voice_) {
        context_.audio().pause(voice_);
        voice_->onEnded = nullptr;
    }
    if (context_.lifecycle().isTracked(this)) {
        context_.lifecycle().untrack(this);
    }
    loading_ = false;
    playRequested_ = false;
}

} // namespace easel
