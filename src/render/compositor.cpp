#include "compositor.hpp"

#include <algorithm>

#ifdef ASCIIMEDIA_HAS_OPENMP
#include <omp.h>
#endif

namespace asciimedia {

Compositor::Compositor(const GlyphAtlas& atlas, const GlyphRasterizer& rasterizer, const RenderConfig& config)
    : atlas_(atlas), config_(config), indexer_(atlas.size()) {
    sprites_.reserve(atlas.size());
    for (const Glyph& glyph : atlas.glyphs()) {
        sprites_.push_back(rasterizer.rasterize(glyph.codepoint, config.boldness));
    }
}

Result Compositor::composite(const FrameBuffer& frame, DrawPolicy policy, FrameBuffer& out) const {
    if (frame.empty()) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "Cannot composite an empty frame");
    }
    if (atlas_.empty()) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "Glyph atlas is empty");
    }
    return policy == DrawPolicy::Exact ? draw_exact(frame, out) : draw_vectorized(frame, out);
}

IndexMap Compositor::index_map(const FrameBuffer& frame) const {
    return indexer_.index_grid(frame, atlas_.cell_width(), atlas_.cell_height());
}

Size Compositor::exact_canvas_size(Size frame, int cell_width, int cell_height, bool clip) {
    if (!clip) return frame;
    return {(frame.width / cell_width) * cell_width - cell_width,
            (frame.height / cell_height) * cell_height - cell_height};
}

Result Compositor::draw_exact(const FrameBuffer& frame, FrameBuffer& out) const {
    const int fw = atlas_.cell_width();
    const int fh = atlas_.cell_height();
    const Size canvas = exact_canvas_size(frame.size(), fw, fh, config_.clip);
    if (canvas.width <= 0 || canvas.height <= 0) {
        return Result::fail(ErrorCode::PROCESSING_ERROR,
                            "Frame " + std::to_string(frame.width()) + "x" + std::to_string(frame.height()) +
                            " is too small to clip to " + std::to_string(fw) + "x" + std::to_string(fh) + " cells");
    }

    out = FrameBuffer(canvas.width, canvas.height, Color::gray(static_cast<uint8_t>(config_.background)));

    for (int row = 0; row < canvas.height; row += fh) {
        for (int col = 0; col < canvas.width; col += fw) {
            const uint8_t* px = frame.row(row) + static_cast<size_t>(col) * FrameBuffer::kChannels;
            const Color fill = config_.monochrome ? *config_.monochrome : Color(px[0], px[1], px[2]);
            draw_glyph(out, sprites_[indexer_.index(px)], col, row, fill);
        }
    }
    return Result::ok();
}

Result Compositor::draw_vectorized(const FrameBuffer& frame, FrameBuffer& out) const {
    const int fw = atlas_.cell_width();
    const int fh = atlas_.cell_height();
    const IndexMap map = index_map(frame);
    if (map.indices.empty()) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, "Frame produced no glyph cells");
    }

    const int out_w = config_.clip ? frame.width() : map.cols * fw;
    const int out_h = config_.clip ? frame.height() : map.rows * fh;
    const bool white = config_.white_background();

    bool mono = false;
    Color mono_color;
    if (config_.monochrome) {
        mono = true;
        mono_color = white ? config_.monochrome->inverted() : *config_.monochrome;
    }

    out = FrameBuffer(out_w, out_h);

#ifdef ASCIIMEDIA_HAS_OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (int y = 0; y < out_h; ++y) {
        const int cell_row = y / fh;
        const int gy = y - cell_row * fh;
        const uint8_t* sample_row = frame.row(cell_row * fh);
        uint8_t* dst = out.row(y);

        for (int cell_col = 0; cell_col < map.cols; ++cell_col) {
            const int x0 = cell_col * fw;
            if (x0 >= out_w) break;
            const int x1 = std::min(x0 + fw, out_w);

            Color color = mono_color;
            if (!mono) {
                const uint8_t* px = sample_row + static_cast<size_t>(x0) * FrameBuffer::kChannels;
                color = Color(px[0], px[1], px[2]);
                if (white) color = color.inverted();
            }

            const float* intensity = atlas_[map.at(cell_col, cell_row)].bitmap.row(gy);
            for (int x = x0; x < x1; ++x) {
                const float g = intensity[x - x0];
                uint8_t* px = dst + static_cast<size_t>(x) * FrameBuffer::kChannels;
                px[0] = static_cast<uint8_t>(g * color.r);
                px[1] = static_cast<uint8_t>(g * color.g);
                px[2] = static_cast<uint8_t>(g * color.b);
                if (white) {
                    px[0] = static_cast<uint8_t>(255 - px[0]);
                    px[1] = static_cast<uint8_t>(255 - px[1]);
                    px[2] = static_cast<uint8_t>(255 - px[2]);
                }
            }
        }
    }
    return Result::ok();
}

}
