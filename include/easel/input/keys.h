#pragma once

/**
 * Key codes
 *
 * Key handlers receive browser-style legacy key codes. keyMap() gives the
 * symbolic names sketches use to compare against them.
 */

#include <cstdint>
#include <map>
#include <string>

namespace easel {
namespace input {

using KeyMap = std::map<std::string, int>;

constexpr int kBackspaceKeyCode = 8;
constexpr int kEnterKeyCode = 13;

/**
 * space, left, up, right, down, '0'-'9', 'a'-'z' and 'A'-'Z'.
 * Upper and lower case letters share a code.
 */
const KeyMap& keyMap();

/**
 * @throws ArgumentError for a name not in keyMap()
 */
int keyCode(const std::string& symbol);

/**
 * Display name for a key code: the key's symbol ("space", "left", "A",
 * "7"), or the number in angle brackets ("<13>") for anything else.
 */
std::string keyName(int keyCode);

/**
 * Translate an SDL keycode. Returns -1 for keys without a legacy code.
 */
int legacyKeyCode(uint32_t sdlKeycode);

} // namespace input
} // namespace easel
