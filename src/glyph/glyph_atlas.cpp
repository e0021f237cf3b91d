#include "glyph_atlas.hpp"
#include "char_sets.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

namespace asciimedia {

GlyphAtlas::GlyphAtlas(std::vector<Glyph> glyphs) : glyphs_(std::move(glyphs)) {
    if (!glyphs_.empty()) {
        cell_width_ = glyphs_.front().width();
        cell_height_ = glyphs_.front().height();
    }
    for (const Glyph& glyph : glyphs_) {
        if (glyph.width() != cell_width_ || glyph.height() != cell_height_) {
            throw std::invalid_argument("GlyphAtlas: glyph bitmaps must share one cell size");
        }
    }
}

const Glyph& GlyphAtlas::at(size_t index) const {
    if (index >= glyphs_.size()) {
        throw std::out_of_range("GlyphAtlas: glyph index out of range");
    }
    return glyphs_[index];
}

std::vector<uint32_t> GlyphAtlas::codepoints() const {
    std::vector<uint32_t> result;
    result.reserve(glyphs_.size());
    for (const Glyph& glyph : glyphs_) {
        result.push_back(glyph.codepoint);
    }
    return result;
}

GlyphAtlasBuilder::GlyphAtlasBuilder(const GlyphRasterizer& rasterizer) : rasterizer_(rasterizer) {}

Result GlyphAtlasBuilder::check(const Config& config) const {
    if (config.codepoints.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "Character set is empty");
    }
    if (config.font_size <= 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "Font size must be positive");
    }
    if (config.boldness < 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "Boldness must not be negative");
    }
    if (config.background != 0 && config.background != 255) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "Background must be 0 or 255");
    }
    return Result::ok();
}

FloatImage GlyphAtlasBuilder::render(uint32_t codepoint, const GlyphMetrics& metrics,
                                     const Config& config) const {
    const uint8_t background = static_cast<uint8_t>(config.background);
    FrameBuffer canvas(metrics.width, metrics.height, Color::gray(background));
    draw_glyph(canvas, rasterizer_.rasterize(codepoint, config.boldness),
               0, origin_offset(config.font_size), Color::gray(static_cast<uint8_t>(255 - background)));

    // The canvas is gray, so one channel carries the coverage.
    FloatImage bitmap(metrics.width, metrics.height);
    float* dst = bitmap.data();
    for (int y = 0; y < metrics.height; ++y) {
        const uint8_t* src = canvas.row(y);
        for (int x = 0; x < metrics.width; ++x) {
            int value = src[static_cast<size_t>(x) * FrameBuffer::kChannels];
            if (config.background == 255) {
                value = 255 - value;
            }
            *dst++ = static_cast<float>(value) / 255.0f;
        }
    }
    return bitmap;
}

Result GlyphAtlasBuilder::build(const Config& config, GlyphAtlas& out) const {
    Result status = check(config);
    if (status.failure()) return status;

    std::vector<uint32_t> codepoints;
    for (uint32_t cp : config.codepoints) {
        if (std::find(codepoints.begin(), codepoints.end(), cp) == codepoints.end()) {
            codepoints.push_back(cp);
        }
    }

    // Every character is checked before any rendering happens.
    std::vector<GlyphMetrics> metrics;
    metrics.reserve(codepoints.size());
    int min_width = std::numeric_limits<int>::max();
    int min_height = std::numeric_limits<int>::max();
    for (uint32_t cp : codepoints) {
        if (!rasterizer_.has_glyph(cp)) {
            return Result::fail(ErrorCode::FONT_ERROR,
                                "Font has no glyph for '" + CharSet::to_utf8(cp) + "'");
        }
        GlyphMetrics m = rasterizer_.measure(cp);
        if (m.width <= 0 || m.height <= 0) {
            return Result::fail(ErrorCode::INVALID_ARGUMENT,
                                "Glyph for '" + CharSet::to_utf8(cp) + "' has zero size at font size " +
                                std::to_string(config.font_size));
        }
        min_width = std::min(min_width, m.width);
        min_height = std::min(min_height, m.height);
        metrics.push_back(m);
    }

    std::vector<Glyph> glyphs;
    glyphs.reserve(codepoints.size());
    for (size_t i = 0; i < codepoints.size(); ++i) {
        Glyph glyph;
        glyph.codepoint = codepoints[i];
        glyph.bitmap = render(codepoints[i], metrics[i], config).cropped(min_width, min_height);
        glyphs.push_back(std::move(glyph));
    }

    std::stable_sort(glyphs.begin(), glyphs.end(), [](const Glyph& a, const Glyph& b) {
        return a.density() > b.density();
    });

    out = GlyphAtlas(std::move(glyphs));
    return Result::ok();
}

}
