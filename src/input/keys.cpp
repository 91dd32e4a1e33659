#include "easel/input/keys.h"
#include "easel/errors.h"
#include <SDL3/SDL.h>

namespace easel {
namespace input {

const KeyMap& keyMap() {
    static const KeyMap map = []() {
        KeyMap m;
        m["space"] = 32;
        m["left"] = 37;
        m["up"] = 38;
        m["right"] = 39;
        m["down"] = 40;
        for (int i = 0; i < 10; i++) {
            m[std::string(1, static_cast<char>('0' + i))] = 48 + i;
        }
        for (int i = 0; i < 26; i++) {
            m[std::string(1, static_cast<char>('A' + i))] = 65 + i;
            m[std::string(1, static_cast<char>('a' + i))] = 65 + i;
        }
        return m;
    }();
    return map;
}

int keyCode(const std::string& symbol) {
    const KeyMap& map = keyMap();
    auto it = map.find(symbol);
    if (it == map.end()) {
        throw ArgumentError("Unknown key name: '" + symbol + "'");
    }
    return it->second;
}

std::string keyName(int code) {
    switch (code) {
        case 32: return "space";
        case 37: return "left";
        case 38: return "up";
        case 39: return "right";
        case 40: return "down";
        default: break;
    }
    if ((code >= 48 && code <= 57) || (code >= 65 && code <= 90)) {
        return std::string(1, static_cast<char>(code));
    }
    return "<" + std::to_string(code) + ">";
}

int legacyKeyCode(uint32_t sdlKey) {
    // Letters and digits: SDL uses the lowercase ASCII value
    if (sdlKey >= SDLK_A && sdlKey <= SDLK_Z) {
        return 65 + static_cast<int>(sdlKey - SDLK_A);
    }
    if (sdlKey >= SDLK_0 && sdlKey <= SDLK_9) {
        return 48 + static_cast<int>(sdlKey - SDLK_0);
    }
    if (sdlKey >= SDLK_F1 && sdlKey <= SDLK_F12) {
        return 112 + static_cast<int>(sdlKey - SDLK_F1);
    }

    switch (sdlKey) {
        case SDLK_BACKSPACE: return kBackspaceKeyCode;
        case SDLK_TAB: return 9;
        case SDLK_RETURN: return kEnterKeyCode;
        case SDLK_KP_ENTER: return kEnterKeyCode;
        case SDLK_LSHIFT:
        case SDLK_RSHIFT: return 16;
        case SDLK_LCTRL:
        case SDLK_RCTRL: return 17;
        case SDLK_LALT:
        case SDLK_RALT: return 18;
        case SDLK_PAUSE: return 19;
        case SDLK_CAPSLOCK: return 20;
        case SDLK_ESCAPE: return 27;
        case SDLK_SPACE: return 32;
        case SDLK_PAGEUP: return 33;
        case SDLK_PAGEDOWN: return 34;
        case SDLK_END: return 35;
        case SDLK_HOME: return 36;
        case SDLK_LEFT: return 37;
        case SDLK_UP: return 38;
        case SDLK_RIGHT: return 39;
        case SDLK_DOWN: return 40;
        case SDLK_INSERT: return 45;
        case SDLK_DELETE: return 46;
        case SDLK_SEMICOLON: return 186;
        case SDLK_EQUALS: return 187;
        case SDLK_COMMA: return 188;
        case SDLK_MINUS: return 189;
        case SDLK_PERIOD: return 190;
        case SDLK_SLASH: return 191;
        case SDLK_GRAVE: return 192;
        case SDLK_LEFTBRACKET: return 219;
        case SDLK_BACKSLASH: return 220;
        case SDLK_RIGHTBRACKET: return 221;
        case SDLK_APOSTROPHE: return 222;
        default: return -1;
    }
}

} // namespace input
} // namespace easel
