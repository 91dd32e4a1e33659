#pragma once

/**
 * Painter - rasterizes a frame buffer with Skia
 *
 * Owns an RGBA raster surface the size of the canvas. paint() fills the
 * background and draws each primitive in order; the pixels stay valid until
 * the next paint().
 */

#include "easel/canvas/draw_primitive.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace easel {
namespace canvas {

class FontCatalog;

class Painter {
public:
    Painter(int width, int height, const FontCatalog& fonts);
    ~Painter();

    void paint(const FrameBuffer& buffer, const std::string& background);

    // RGBA8888, premultiplied
    const uint8_t* pixels() const;
    size_t rowBytes() const;

    int width() const { return width_; }
    int height() const { return height_; }

    Painter(const Painter&) = delete;
    Painter& operator=(const Painter&) = delete;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    int width_;
    int height_;
};

} // namespace canvas
} // namespace easel
