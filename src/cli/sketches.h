#pragma once

/**
 * Built-in sketches for `easel run <name>`
 */

#include "easel/runtime.h"
#include <functional>
#include <string>
#include <vector>

namespace easel {
namespace cli {

struct SketchOptions {
    int width = 0;   // 0 = the sketch's own size
    int height = 0;
    std::vector<std::string> assets;
    std::string sound;
    bool quiet = false;
};

struct Sketch {
    const char* name;
    const char* description;
    std::function<void(Runtime&, const SketchOptions&)> setup;
};

const std::vector<Sketch>& sketches();

/**
 * nullptr if no sketch has that name
 */
const Sketch* findSketch(const std::string& name);

} // namespace cli
} // namespace easel
