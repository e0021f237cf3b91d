#pragma once

#include "core/types.hpp"
#include "font_loader.hpp"
#include <vector>
#include <cstdint>

namespace asciimedia {

// Normalized ink density of one character, 1.0 = fully inked.
struct Glyph {
    uint32_t codepoint = 0;
    FloatImage bitmap;

    int width() const { return bitmap.width(); }
    int height() const { return bitmap.height(); }
    float density() const { return bitmap.sum(); }
};

// Glyphs of identical size, densest first. Immutable once built and shared
// read-only by every compositor.
class GlyphAtlas {
public:
    GlyphAtlas() = default;
    explicit GlyphAtlas(std::vector<Glyph> glyphs);

    size_t size() const { return glyphs_.size(); }
    bool empty() const { return glyphs_.empty(); }
    int cell_width() const { return cell_width_; }
    int cell_height() const { return cell_height_; }

    const Glyph& at(size_t index) const;
    const Glyph& operator[](size_t index) const { return glyphs_[index]; }
    const std::vector<Glyph>& glyphs() const { return glyphs_; }
    std::vector<uint32_t> codepoints() const;

private:
    std::vector<Glyph> glyphs_;
    int cell_width_ = 0;
    int cell_height_ = 0;
};

class GlyphAtlasBuilder {
public:
    struct Config {
        std::vector<uint32_t> codepoints;
        int font_size = 20;
        int boldness = 2;
        int background = 255;
    };

    explicit GlyphAtlasBuilder(const GlyphRasterizer& rasterizer);

    Result build(const Config& config, GlyphAtlas& out) const;

    // Vertical pen offset that keeps tall glyphs from being clipped at the
    // top of their cell.
    static int origin_offset(int font_size) { return -(font_size / 6); }

private:
    Result check(const Config& config) const;
    FloatImage render(uint32_t codepoint, const GlyphMetrics& metrics, const Config& config) const;

    const GlyphRasterizer& rasterizer_;
};

}
