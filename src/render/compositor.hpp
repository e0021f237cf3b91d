#pragma once

#include "core/types.hpp"
#include "core/config.hpp"
#include "glyph/font_loader.hpp"
#include "glyph/glyph_atlas.hpp"
#include "mapping/luminance_indexer.hpp"
#include <vector>

namespace asciimedia {

// Turns a frame into its ASCII rendering. All state is fixed at construction,
// so one Compositor can serve any number of threads at once.
class Compositor {
public:
    // `atlas` must outlive the compositor. The rasterizer is only used here,
    // to prepare the stroked glyphs the exact policy draws.
    Compositor(const GlyphAtlas& atlas, const GlyphRasterizer& rasterizer, const RenderConfig& config);

    Result composite(const FrameBuffer& frame, FrameBuffer& out) const {
        return composite(frame, config_.policy, out);
    }
    Result composite(const FrameBuffer& frame, DrawPolicy policy, FrameBuffer& out) const;

    // Draws each cell's character with the font rasterizer, colored by the
    // cell's top-left pixel or the monochrome color.
    Result draw_exact(const FrameBuffer& frame, FrameBuffer& out) const;

    // Tiles atlas bitmaps over the strided frame and modulates them by the
    // color layer in one pass.
    Result draw_vectorized(const FrameBuffer& frame, FrameBuffer& out) const;

    // Glyph choice per cell; shared by both policies.
    IndexMap index_map(const FrameBuffer& frame) const;

    // With clipping, each dimension shrinks to whole cells minus one cell.
    static Size exact_canvas_size(Size frame, int cell_width, int cell_height, bool clip);

    const GlyphAtlas& atlas() const { return atlas_; }
    const RenderConfig& config() const { return config_; }

private:
    const GlyphAtlas& atlas_;
    RenderConfig config_;
    LuminanceIndexer indexer_;
    std::vector<GlyphBitmap> sprites_;
};

}
