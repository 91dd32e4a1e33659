#pragma once

#include <memory>
#include <string>

class SkFont;

namespace easel {
namespace canvas {

enum class FontFace { Serif, SansSerif, Monospace };

/**
 * "serif", "sans-serif" or "monospace".
 * @throws ArgumentError for any other name
 */
FontFace parseFontFace(const std::string& name);

const char* fontFaceName(FontFace face);

/**
 * @throws ArgumentError if the text contains control characters
 */
void validateText(const std::string& text);

/**
 * @throws ArgumentError unless size > 0
 */
void validateFontSize(double size);

/**
 * FontCatalog - resolves faces to typefaces through the platform font manager
 * (fontconfig on Linux) and measures text.
 */
class FontCatalog {
public:
    FontCatalog();
    ~FontCatalog();

    SkFont font(FontFace face, float size) const;

    /**
     * Advance width of the text in pixels, rounded to the nearest integer.
     */
    int textWidth(const std::string& text, float size, FontFace face) const;

    FontCatalog(const FontCatalog&) = delete;
    FontCatalog& operator=(const FontCatalog&) = delete;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace canvas
} // namespace easel
