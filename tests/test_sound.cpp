#include <doctest/doctest.h>

#include "easel/audio/audio_mixer.h"
#include "easel/errors.h"
#include "easel/runtime/sound.h"
#include "test_support.h"

#include <memory>
#include <string>
#include <vector>

using easel::Sound;
using easel::audio::AudioMixer;
using easel::audio::SoundBuffer;
using easel::audio::Voice;
using easel::testing::ContextFixture;
using easel::testing::TempFile;
using easel::testing::encodeSilentWav;

namespace {

std::shared_ptr<Sound> loadSound(ContextFixture& f, const std::string& url) {
    auto sound = std::make_shared<Sound>(f.context, url);
    sound->load();
    return sound;
}

bool tracked(ContextFixture& f, const std::shared_ptr<Sound>& sound) {
    return f.context.lifecycle().isTracked(sound.get());
}

} // namespace

TEST_CASE("a sound keeps the program alive while it loads") {
    ContextFixture f;
    TempFile file("easel_sound_load.wav", encodeSilentWav(8000, 800));

    auto sound = loadSound(f, file.path.string());
    CHECK(sound->isLoading());
    CHECK(tracked(f, sound));

    f.runUntil([&sound]() { return !sound->isLoading(); });
    CHECK(sound->isLoaded());
    CHECK(sound->errorMessage().empty());
    CHECK_FALSE(tracked(f, sound));
    CHECK_FALSE(sound->isPlaying());
}

TEST_CASE("play before the data arrives starts playback once loaded") {
    ContextFixture f;
    // Eight seconds: still playing when the checks run
    TempFile file("easel_sound_early.wav", encodeSilentWav(8000, 64000));

    auto sound = loadSound(f, file.path.string());
    sound->play();
    CHECK_FALSE(sound->isPlaying());

    f.runUntil([&sound]() { return !sound->isLoading(); });
    REQUIRE(sound->isLoaded());
    CHECK(sound->isPlaying());
    CHECK(tracked(f, sound));

    sound->pause();
    CHECK_FALSE(sound->isPlaying());
    CHECK_FALSE(tracked(f, sound));

    sound->play();
    CHECK(tracked(f, sound));

    sound->rewind();
    CHECK_FALSE(sound->isPlaying());
    CHECK_FALSE(tracked(f, sound));
}

TEST_CASE("a sound that plays to the end releases the program") {
    ContextFixture f;
    TempFile file("easel_sound_short.wav", encodeSilentWav(8000, 80));

    auto sound = loadSound(f, file.path.string());
    f.runUntil([&sound]() { return !sound->isLoading(); });
    REQUIRE(sound->isLoaded());

    sound->play();
    CHECK(tracked(f, sound));

    f.runUntil([&]() { return !tracked(f, sound); });
    CHECK_FALSE(tracked(f, sound));
    CHECK_FALSE(sound->isPlaying());
}

TEST_CASE("a missing sound file is untracked and keeps its error") {
    ContextFixture f;

    auto sound = loadSound(f, "/nonexistent/easel/missing.wav");
    f.runUntil([&sound]() { return !sound->isLoading(); });

    CHECK_FALSE(sound->isLoaded());
    CHECK_FALSE(sound->errorMessage().empty());
    CHECK_FALSE(tracked(f, sound));

    sound->play();
    CHECK_FALSE(sound->isPlaying());
    CHECK_FALSE(tracked(f, sound));
}

TEST_CASE("without a playback device play does not hold the program") {
    easel::RuntimeConfig config;
    config.audioEnabled = false;
    ContextFixture f(config);
    TempFile file("easel_sound_nodevice.wav", encodeSilentWav(8000, 800));

    auto sound = loadSound(f, file.path.string());
    f.runUntil([&sound]() { return !sound->isLoading(); });
    REQUIRE(sound->isLoaded());

    sound->play();
    CHECK_FALSE(sound->isPlaying());
    CHECK_FALSE(tracked(f, sound));
    CHECK_FALSE(f.context.audio().isOpen());
}

TEST_CASE("volume must lie between 0 and 1") {
    ContextFixture f;
    auto sound = std::make_shared<Sound>(f.context, "unused.wav");

    sound->setVolume(0.25);
    CHECK(sound->volume() == doctest::Approx(0.25));
    CHECK_THROWS_AS(sound->setVolume(1.5), easel::ArgumentError);
    CHECK_THROWS_AS(sound->setVolume(-0.1), easel::ArgumentError);
    CHECK(sound->volume() == doctest::Approx(0.25));
}

TEST_CASE("an end reported before a replay does not stop the new playback") {
    ContextFixture f;
    AudioMixer& mixer = f.context.audio();
    REQUIRE(mixer.open());

    // One second of silence
    auto buffer = std::make_shared<SoundBuffer>(
        std::vector<float>(static_cast<size_t>(easel::audio::kMixerSampleRate) * easel::audio::kMixerChannels, 0.0f));
    auto voice = std::make_shared<Voice>(buffer);
    int ended = 0;
    voice->onEnded = [&ended]() { ended++; };

    std::vector<float> out(64 * easel::audio::kMixerChannels);

    // Positions are only set while the audio thread cannot see the voice
    voice->position.store(buffer->frames() - 10);
    mixer.play(voice);
    mixer.mix(out.data(), 64);
    CHECK_FALSE(mixer.isActive(voice));

    // Played again before the end notification reached the loop
    mixer.play(voice);
    f.runFor(50);
    CHECK(ended == 0);
    CHECK(mixer.isActive(voice));

    // The latest playback still reports its own end
    mixer.pause(voice);
    voice->position.store(buffer->frames() - 10);
    mixer.play(voice);
    mixer.mix(out.data(), 64);
    f.runUntil([&ended]() { return ended > 0; });
    CHECK(ended == 1);

    mixer.close();
}
