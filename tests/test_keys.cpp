#include <doctest/doctest.h>

#include "easel/errors.h"
#include "easel/input/keys.h"

#include <SDL3/SDL.h>

using namespace easel::input;

TEST_CASE("key map holds the symbolic keys") {
    const KeyMap& map = keyMap();
    // space, four arrows, ten digits, 26 letters in two cases
    CHECK(map.size() == 67);

    CHECK(keyCode("space") == 32);
    CHECK(keyCode("left") == 37);
    CHECK(keyCode("up") == 38);
    CHECK(keyCode("right") == 39);
    CHECK(keyCode("down") == 40);
    CHECK(keyCode("0") == 48);
    CHECK(keyCode("9") == 57);
    CHECK(keyCode("A") == 65);
    CHECK(keyCode("z") == 90);
    CHECK(keyCode("a") == keyCode("A"));
}

TEST_CASE("unknown key names are argument errors") {
    CHECK_THROWS_AS(keyCode("enter"), easel::ArgumentError);
    CHECK_THROWS_AS(keyCode(""), easel::ArgumentError);
    CHECK_THROWS_AS(keyCode("AA"), easel::ArgumentError);
}

TEST_CASE("key names round trip through codes") {
    for (const auto& entry : keyMap()) {
        std::string name = keyName(entry.second);
        CHECK(keyCode(name) == entry.second);
    }
    CHECK(keyName(13) == "<13>");
    CHECK(keyName(65) == "A");
}

TEST_CASE("SDL keycodes translate to legacy codes") {
    CHECK(legacyKeyCode(SDLK_A) == 65);
    CHECK(legacyKeyCode(SDLK_Z) == 90);
    CHECK(legacyKeyCode(SDLK_0) == 48);
    CHECK(legacyKeyCode(SDLK_SPACE) == 32);
    CHECK(legacyKeyCode(SDLK_LEFT) == 37);
    CHECK(legacyKeyCode(SDLK_DOWN) == 40);
    CHECK(legacyKeyCode(SDLK_RETURN) == 13);
    CHECK(legacyKeyCode(SDLK_F1) == 112);
    CHECK(legacyKeyCode(SDLK_UNKNOWN) == -1);
}
