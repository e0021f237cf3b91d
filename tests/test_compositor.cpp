#include <iostream>
#include <cassert>
#include <stdexcept>
#include <thread>
#include <vector>

#include "../src/core/types.hpp"
#include "../src/core/config.hpp"
#include "../src/glyph/char_sets.hpp"
#include "../src/glyph/glyph_atlas.hpp"
#include "../src/mapping/luminance_indexer.hpp"
#include "../src/render/compositor.hpp"
#include "fake_rasterizer.hpp"

using namespace asciimedia;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

static const Color kWhite = Color::gray(255);
static const Color kBlack = Color::gray(0);

static RenderConfig render_config(const std::string& chars, int background = 255) {
    RenderConfig cfg;
    cfg.codepoints = CharSet::to_codepoints(chars);
    cfg.font_size = kUnshiftedFontSize;
    cfg.boldness = 0;
    cfg.background = background;
    return cfg;
}

static GlyphAtlas build_atlas(const GlyphRasterizer& r, const RenderConfig& cfg) {
    GlyphAtlasBuilder::Config atlas_cfg;
    atlas_cfg.codepoints = cfg.codepoints;
    atlas_cfg.font_size = cfg.font_size;
    atlas_cfg.boldness = cfg.boldness;
    atlas_cfg.background = cfg.background;

    GlyphAtlas atlas;
    Result res = GlyphAtlasBuilder(r).build(atlas_cfg, atlas);
    if (res.failure()) throw std::runtime_error(res.message);
    return atlas;
}

static bool all_pixels(const FrameBuffer& frame, const Color& c) {
    for (int y = 0; y < frame.height(); ++y) {
        for (int x = 0; x < frame.width(); ++x) {
            if (frame.get_pixel(x, y) != c) return false;
        }
    }
    return true;
}

static bool all_indices(const IndexMap& map, int value) {
    for (int idx : map.indices) {
        if (idx != value) return false;
    }
    return !map.indices.empty();
}

static FrameBuffer gradient_frame(int w, int h) {
    FrameBuffer frame(w, h);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            frame.set_pixel(x, y, Color(static_cast<uint8_t>((x * 4) % 256),
                                        static_cast<uint8_t>((y * 4) % 256), 100));
        }
    }
    return frame;
}

TEST(luminance_weights) {
    assert(LuminanceIndexer::luminance(0, 0, 0) == 0);
    assert(LuminanceIndexer::luminance(255, 255, 255) == 255);
    assert(LuminanceIndexer::luminance(255, 0, 0) == 76);
    assert(LuminanceIndexer::luminance(0, 255, 0) == 149);
    assert(LuminanceIndexer::luminance(0, 0, 255) == 28);
}

TEST(luminance_index_range) {
    const size_t sizes[] = {1, 2, 3, 7, 90, 255, 256, 300};
    for (size_t n : sizes) {
        LuminanceIndexer indexer(n);
        for (int r = 0; r <= 255; r += 15) {
            for (int g = 0; g <= 255; g += 15) {
                for (int b = 0; b <= 255; b += 15) {
                    int idx = indexer.index(static_cast<uint8_t>(r), static_cast<uint8_t>(g),
                                            static_cast<uint8_t>(b));
                    assert(idx >= 0 && idx < static_cast<int>(n));
                }
            }
        }
        assert(indexer.index(kBlack) == 0);
        if (n <= 256) {
            assert(indexer.index(kWhite) == static_cast<int>(n) - 1);
        }
    }
}

TEST(luminance_rejects_empty_atlas) {
    bool threw = false;
    try {
        LuminanceIndexer indexer(0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

TEST(index_grid_samples_top_left) {
    LuminanceIndexer indexer(2);
    FrameBuffer frame(17, 9, kBlack);
    frame.set_pixel(16, 8, kWhite);
    frame.set_pixel(1, 1, kWhite);

    IndexMap map = indexer.index_grid(frame, 8, 8);
    assert(map.cols == 3);
    assert(map.rows == 2);
    assert(map.at(2, 1) == 1);
    assert(map.at(0, 0) == 0);
    assert(map.at(1, 0) == 0);
}

TEST(two_glyph_example_vectorized) {
    FakeRasterizer r = make_box_rasterizer();
    RenderConfig cfg = render_config("# ");
    GlyphAtlas atlas = build_atlas(r, cfg);
    Compositor compositor(atlas, r, cfg);

    FrameBuffer out;
    FrameBuffer black(16, 16, kBlack);
    assert(compositor.composite(black, DrawPolicy::Vectorized, out).success());
    IndexMap map = compositor.index_map(black);
    assert(map.cols == 2 && map.rows == 2);
    assert(all_indices(map, 0));
    assert(out.size() == black.size());
    assert(all_pixels(out, kBlack));

    FrameBuffer white(16, 16, kWhite);
    assert(compositor.composite(white, DrawPolicy::Vectorized, out).success());
    assert(all_indices(compositor.index_map(white), 1));
    assert(all_pixels(out, kWhite));
}

TEST(two_glyph_example_exact) {
    FakeRasterizer r = make_box_rasterizer();
    RenderConfig cfg = render_config("# ");
    GlyphAtlas atlas = build_atlas(r, cfg);
    Compositor compositor(atlas, r, cfg);

    FrameBuffer out;
    FrameBuffer black(24, 24, kBlack);
    assert(compositor.composite(black, DrawPolicy::Exact, out).success());
    assert(out.width() == 16 && out.height() == 16);
    assert(all_pixels(out, kBlack));

    FrameBuffer white(24, 24, kWhite);
    assert(compositor.composite(white, DrawPolicy::Exact, out).success());
    assert(out.width() == 16 && out.height() == 16);
    assert(all_pixels(out, kWhite));
}

TEST(clipping_dimension_laws) {
    FakeRasterizer r = make_box_rasterizer();
    RenderConfig clipped = render_config("#+. ");
    RenderConfig unclipped = clipped;
    unclipped.clip = false;
    GlyphAtlas atlas = build_atlas(r, clipped);
    Compositor clip_comp(atlas, r, clipped);
    Compositor free_comp(atlas, r, unclipped);

    const Size sizes[] = {{20, 37}, {33, 50}, {64, 64}, {17, 90}};
    for (const Size& size : sizes) {
        FrameBuffer frame = gradient_frame(size.width, size.height);
        FrameBuffer out;

        assert(clip_comp.composite(frame, DrawPolicy::Exact, out).success());
        assert(out.width() % 8 == 0 && out.height() % 8 == 0);
        assert(out.width() < (size.width / 8) * 8);
        assert(out.height() < (size.height / 8) * 8);

        assert(clip_comp.composite(frame, DrawPolicy::Vectorized, out).success());
        assert(out.size() == size);

        assert(free_comp.composite(frame, DrawPolicy::Vectorized, out).success());
        assert(out.width() == (size.width + 7) / 8 * 8);
        assert(out.height() == (size.height + 7) / 8 * 8);

        assert(free_comp.composite(frame, DrawPolicy::Exact, out).success());
        assert(out.size() == size);
    }

    assert(Compositor::exact_canvas_size({16, 16}, 8, 8, true) == (Size{8, 8}));
    assert(Compositor::exact_canvas_size({23, 31}, 8, 8, true) == (Size{8, 16}));
    assert(Compositor::exact_canvas_size({23, 31}, 8, 8, false) == (Size{23, 31}));
}

TEST(exact_rejects_frames_smaller_than_clip) {
    FakeRasterizer r = make_box_rasterizer();
    RenderConfig cfg = render_config("# ");
    GlyphAtlas atlas = build_atlas(r, cfg);
    Compositor compositor(atlas, r, cfg);

    FrameBuffer out;
    Result res = compositor.composite(FrameBuffer(10, 10, kBlack), DrawPolicy::Exact, out);
    assert(res.error == ErrorCode::PROCESSING_ERROR);

    res = compositor.composite(FrameBuffer(), DrawPolicy::Vectorized, out);
    assert(res.error == ErrorCode::PROCESSING_ERROR);
}

TEST(monochrome_changes_color_not_glyphs) {
    FakeRasterizer r = make_box_rasterizer();
    RenderConfig color_cfg = render_config("#+. ");
    RenderConfig mono_cfg = color_cfg;
    mono_cfg.monochrome = Color(200, 0, 0);
    GlyphAtlas atlas = build_atlas(r, color_cfg);
    Compositor color_comp(atlas, r, color_cfg);
    Compositor mono_comp(atlas, r, mono_cfg);

    FrameBuffer frame = gradient_frame(64, 64);
    assert(color_comp.index_map(frame) == mono_comp.index_map(frame));

    const DrawPolicy policies[] = {DrawPolicy::Vectorized, DrawPolicy::Exact};
    for (DrawPolicy policy : policies) {
        FrameBuffer color_out, mono_out;
        assert(color_comp.composite(frame, policy, color_out).success());
        assert(mono_comp.composite(frame, policy, mono_out).success());
        assert(color_out.size() == mono_out.size());

        bool saw_ink = false;
        for (int y = 0; y < color_out.height(); ++y) {
            for (int x = 0; x < color_out.width(); ++x) {
                bool color_bg = color_out.get_pixel(x, y) == kWhite;
                bool mono_bg = mono_out.get_pixel(x, y) == kWhite;
                assert(color_bg == mono_bg);
                if (!mono_bg) {
                    assert(mono_out.get_pixel(x, y) == Color(200, 0, 0));
                    saw_ink = true;
                }
            }
        }
        assert(saw_ink);
    }
}

TEST(uniform_input_uses_extreme_glyphs) {
    FakeRasterizer r = make_box_rasterizer();
    RenderConfig cfg = render_config("#+. ");
    GlyphAtlas atlas = build_atlas(r, cfg);
    Compositor compositor(atlas, r, cfg);

    FrameBuffer zeros(40, 40, kBlack);
    FrameBuffer full(40, 40, kWhite);
    assert(all_indices(compositor.index_map(zeros), 0));
    assert(all_indices(compositor.index_map(full), static_cast<int>(atlas.size()) - 1));

    const DrawPolicy policies[] = {DrawPolicy::Vectorized, DrawPolicy::Exact};
    for (DrawPolicy policy : policies) {
        FrameBuffer out;
        assert(compositor.composite(zeros, policy, out).success());
        assert(all_pixels(out, kBlack));
        assert(compositor.composite(full, policy, out).success());
        assert(all_pixels(out, kWhite));
    }
}

TEST(black_background_keeps_source_color) {
    FakeRasterizer r = make_box_rasterizer();
    RenderConfig cfg = render_config("# ", 0);
    GlyphAtlas atlas = build_atlas(r, cfg);
    Compositor compositor(atlas, r, cfg);

    const Color red(255, 0, 0);
    FrameBuffer frame(24, 24, red);
    FrameBuffer out;

    assert(compositor.composite(frame, DrawPolicy::Vectorized, out).success());
    assert(all_pixels(out, red));
    assert(compositor.composite(frame, DrawPolicy::Exact, out).success());
    assert(out.width() == 16);
    assert(all_pixels(out, red));
}

TEST(monochrome_on_white_background) {
    FakeRasterizer r = make_box_rasterizer();
    RenderConfig cfg = render_config("# ");
    cfg.monochrome = Color(10, 20, 30);
    GlyphAtlas atlas = build_atlas(r, cfg);
    Compositor compositor(atlas, r, cfg);

    FrameBuffer frame(24, 24, kBlack);
    FrameBuffer out;
    assert(compositor.composite(frame, DrawPolicy::Vectorized, out).success());
    assert(all_pixels(out, Color(10, 20, 30)));
    assert(compositor.composite(frame, DrawPolicy::Exact, out).success());
    assert(all_pixels(out, Color(10, 20, 30)));
}

TEST(policies_agree_on_solid_glyphs) {
    FakeRasterizer r = make_box_rasterizer();
    RenderConfig cfg = render_config("# ");
    cfg.clip = false;
    GlyphAtlas atlas = build_atlas(r, cfg);
    Compositor compositor(atlas, r, cfg);

    FrameBuffer frame(32, 16, kWhite);
    const Color cells[] = {Color(20, 40, 60), kWhite, Color(90, 10, 0), kWhite,
                           kWhite, Color(0, 0, 0), Color(60, 60, 60), kWhite};
    for (int cy = 0; cy < 2; ++cy) {
        for (int cx = 0; cx < 4; ++cx) {
            for (int y = 0; y < 8; ++y) {
                for (int x = 0; x < 8; ++x) {
                    frame.set_pixel(cx * 8 + x, cy * 8 + y, cells[cy * 4 + cx]);
                }
            }
        }
    }

    FrameBuffer exact, vectorized;
    assert(compositor.composite(frame, DrawPolicy::Exact, exact).success());
    assert(compositor.composite(frame, DrawPolicy::Vectorized, vectorized).success());
    assert(exact == vectorized);
    assert(exact == frame);
}

TEST(composite_is_thread_safe) {
    FakeRasterizer r = make_box_rasterizer();
    RenderConfig cfg = render_config("#+. ");
    GlyphAtlas atlas = build_atlas(r, cfg);
    const Compositor compositor(atlas, r, cfg);

    FrameBuffer frame = gradient_frame(96, 64);
    FrameBuffer expected;
    assert(compositor.composite(frame, DrawPolicy::Exact, expected).success());

    std::vector<FrameBuffer> results(4);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i] {
            Result res = compositor.composite(frame, DrawPolicy::Exact, results[i]);
            if (res.failure()) results[i] = FrameBuffer();
        });
    }
    for (auto& t : threads) t.join();

    for (const FrameBuffer& out : results) {
        assert(out == expected);
    }
}

int main() {
    std::cout << "=== Compositor Tests ===\n\n";

    std::cout << "--- Luminance Indexer ---\n";
    RUN_TEST(luminance_weights);
    RUN_TEST(luminance_index_range);
    RUN_TEST(luminance_rejects_empty_atlas);
    RUN_TEST(index_grid_samples_top_left);

    std::cout << "\n--- Drawing Policies ---\n";
    RUN_TEST(two_glyph_example_vectorized);
    RUN_TEST(two_glyph_example_exact);
    RUN_TEST(clipping_dimension_laws);
    RUN_TEST(exact_rejects_frames_smaller_than_clip);
    RUN_TEST(monochrome_changes_color_not_glyphs);
    RUN_TEST(uniform_input_uses_extreme_glyphs);
    RUN_TEST(black_background_keeps_source_color);
    RUN_TEST(monochrome_on_white_background);
    RUN_TEST(policies_agree_on_solid_glyphs);
    RUN_TEST(composite_is_thread_safe);

    std::cout << "=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\nAll tests passed!\n";
        return 0;
    } else {
        std::cout << "\nSome tests failed!\n";
        return 1;
    }
}
