#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>
#include <memory>

namespace asciimedia {

struct FontInfoImpl;

// Anti-aliased coverage of one character. Offsets place the bitmap relative
// to the pen origin, which is the top-left corner of the character's line box.
struct GlyphBitmap {
    std::vector<uint8_t> pixels;
    int width = 0;
    int height = 0;
    int offset_x = 0;
    int offset_y = 0;

    bool empty() const { return pixels.empty(); }
    uint8_t at(int x, int y) const { return pixels[static_cast<size_t>(y) * width + x]; }
};

struct GlyphMetrics {
    int width = 0;
    int height = 0;
};

class GlyphRasterizer {
public:
    virtual ~GlyphRasterizer() = default;

    virtual bool has_glyph(uint32_t codepoint) const = 0;
    // Line-box size of a single character, independent of stroke width.
    virtual GlyphMetrics measure(uint32_t codepoint) const = 0;
    virtual GlyphBitmap rasterize(uint32_t codepoint, int stroke_width) const = 0;
};

class FontLoader : public GlyphRasterizer {
public:
    FontLoader();
    ~FontLoader() override;

    Result load(const std::string& path, float pixel_size = 20.0f);
    Result load_from_memory(const uint8_t* data, size_t size, float pixel_size = 20.0f);
    Result load_system_fallback(float pixel_size = 20.0f);

    bool has_glyph(uint32_t codepoint) const override;
    GlyphMetrics measure(uint32_t codepoint) const override;
    GlyphBitmap rasterize(uint32_t codepoint, int stroke_width) const override;

    bool is_loaded() const { return loaded_; }
    float pixel_size() const { return pixel_size_; }
    int ascent() const { return ascent_px_; }
    const std::string& path() const { return path_; }

    static std::string find_system_monospace_font();

private:
    std::unique_ptr<FontInfoImpl> font_info_;
    std::vector<uint8_t> font_data_;
    std::string path_;
    float scale_ = 1.0f;
    float pixel_size_ = 20.0f;
    int ascent_px_ = 0;
    bool loaded_ = false;
};

// Grows coverage by `radius` pixels in every direction (disc structuring
// element), which is how stroke width is applied to a filled glyph.
GlyphBitmap dilate(const GlyphBitmap& glyph, int radius);

// Alpha-blends `fill` into `canvas` using the glyph coverage, with the pen
// origin at (x, y). Pixels outside the canvas are dropped.
void draw_glyph(FrameBuffer& canvas, const GlyphBitmap& glyph, int x, int y, const Color& fill);

}
