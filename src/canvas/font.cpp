#include "easel/canvas/font.h"
#include "easel/errors.h"
#include <cmath>
#include <iostream>

#include "include/core/SkFont.h"
#include "include/core/SkFontMgr.h"
#include "include/core/SkFontStyle.h"
#include "include/core/SkTypeface.h"

#if defined(__APPLE__)
#include "include/ports/SkFontMgr_mac_ct.h"
#else
#include "include/ports/SkFontMgr_fontconfig.h"
#include "include/ports/SkFontScanner_FreeType.h"
#endif

namespace easel {
namespace canvas {

FontFace parseFontFace(const std::string& name) {
    if (name == "serif") return FontFace::Serif;
    if (name == "sans-serif") return FontFace::SansSerif;
    if (name == "monospace") return FontFace::Monospace;
    throw ArgumentError("Invalid font face '" + name + "': expected serif, sans-serif or monospace");
}

const char* fontFaceName(FontFace face) {
    switch (face) {
        case FontFace::Serif: return "serif";
        case FontFace::SansSerif: return "sans-serif";
        case FontFace::Monospace: return "monospace";
    }
    return "serif";
}

void validateText(const std::string& text) {
    for (unsigned char c : text) {
        // Bytes >= 0x80 belong to UTF-8 sequences and are accepted
        if (c < 0x20 || c == 0x7F) {
            throw ArgumentError("Text must be printable");
        }
    }
}

void validateFontSize(double size) {
    if (!(size > 0.0)) {
        throw ArgumentError("Font size must be positive");
    }
}

// ============================================================================
// FontCatalog
// ============================================================================

struct FontCatalog::Impl {
    sk_sp<SkFontMgr> fontMgr;
    sk_sp<SkTypeface> typefaces[3];

    Impl() {
#if defined(__APPLE__)
        fontMgr = SkFontMgr_New_CoreText(nullptr);
#else
        fontMgr = SkFontMgr_New_FontConfig(nullptr, SkFontScanner_Make_FreeType());
#endif
        if (!fontMgr) {
            std::cerr << "[Font] No platform font manager, text will not render" << std::endl;
            fontMgr = SkFontMgr::RefEmpty();
        }

        const FontFace faces[] = {FontFace::Serif, FontFace::SansSerif, FontFace::Monospace};
        for (FontFace face : faces) {
            sk_sp<SkTypeface> typeface = fontMgr->matchFamilyStyle(fontFaceName(face), SkFontStyle::Normal());
            if (!typeface) {
                typeface = fontMgr->matchFamilyStyle(nullptr, SkFontStyle::Normal());
            }
            typefaces[static_cast<int>(face)] = typeface;
        }
    }
};

FontCatalog::FontCatalog() : impl_(std::make_unique<Impl>()) {}

FontCatalog::~FontCatalog() = default;

SkFont FontCatalog::font(FontFace face, float size) const {
    SkFont font(impl_->typefaces[static_cast<int>(face)], size);
    font.setSubpixel(true);
    return font;
}

int FontCatalog::textWidth(const std::string& text, float size, FontFace face) const {
    SkFont f = font(face, size);
    SkScalar width = f.measureText(text.c_str(), text.length(), SkTextEncoding::kUTF8);
    return static_cast<int>(std::lround(width));
}

} // namespace canvas
} // namespace easel
