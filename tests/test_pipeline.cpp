#include <iostream>
#include <atomic>
#include <cassert>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "../src/core/types.hpp"
#include "../src/core/config.hpp"
#include "../src/core/frame_source.hpp"
#include "../src/core/frame_pipeline.hpp"
#include "../src/core/worker_pool.hpp"
#include "../src/glyph/char_sets.hpp"
#include "../src/glyph/glyph_atlas.hpp"
#include "../src/render/compositor.hpp"
#include "../src/render/frame_sink.hpp"
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

// Frames whose red channel carries their position in the stream.
class LabeledSource : public FrameSource {
public:
    LabeledSource(int count, int size, double fps = 10.0, double duration = 1.0)
        : count_(count), size_(size), fps_(fps), duration_(duration) {}

    bool open(const std::string&) override { next_ = 0; failed_ = false; return true; }
    bool read(FrameBuffer& out) override {
        if (failed_ || next_ >= count_) return false;
        if (next_ == fail_at_) {
            failed_ = true;
            return false;
        }
        int side = size_;
        if (next_ == small_frame_) side = size_ / 3;
        if (next_ == large_frame_) side = size_ + 16;
        out = FrameBuffer(side, side, Color(label(next_), 0, 0));
        ++next_;
        return true;
    }
    double fps() const override { return fps_; }
    double duration() const override { return duration_; }
    bool is_open() const override { return true; }
    bool failed() const override { return failed_; }

    static uint8_t label(int i) { return static_cast<uint8_t>(10 + i * 10); }

    // Makes one frame too small for the exact policy's clipping.
    void shrink_frame(int index) { small_frame_ = index; }
    // Makes one frame larger than the rest.
    void grow_frame(int index) { large_frame_ = index; }
    // Stops with a decode error once `count` frames have been delivered.
    void fail_after(int count) { fail_at_ = count; }

private:
    int count_;
    int size_;
    double fps_;
    double duration_;
    int next_ = 0;
    int small_frame_ = -1;
    int large_frame_ = -1;
    int fail_at_ = -1;
    bool failed_ = false;
};

class CollectingSink : public FrameSink {
public:
    Result open(int width, int height, double fps) override {
        ++open_calls;
        opened = true;
        size = {width, height};
        this->fps = fps;
        return Result::ok();
    }
    Result write(const FrameBuffer& frame) override {
        frames.push_back(frame);
        return Result::ok();
    }
    Result close() override {
        opened = false;
        closed = true;
        return Result::ok();
    }
    bool is_open() const override { return opened; }

    std::vector<FrameBuffer> frames;
    Size size;
    double fps = 0.0;
    int open_calls = 0;
    bool opened = false;
    bool closed = false;
};

// Black background and full-cell glyphs: every dark frame renders as its own
// solid color, which keeps the label readable after compositing.
struct Harness {
    FakeRasterizer rasterizer = make_box_rasterizer();
    RenderConfig config;
    GlyphAtlas atlas;

    explicit Harness(int workers, DrawPolicy policy = DrawPolicy::Vectorized) {
        config.codepoints = CharSet::to_codepoints("# ");
        config.font_size = kUnshiftedFontSize;
        config.boldness = 0;
        config.background = 0;
        config.workers = workers;
        config.policy = policy;

        GlyphAtlasBuilder::Config atlas_cfg;
        atlas_cfg.codepoints = config.codepoints;
        atlas_cfg.font_size = config.font_size;
        atlas_cfg.boldness = config.boldness;
        atlas_cfg.background = config.background;
        Result res = GlyphAtlasBuilder(rasterizer).build(atlas_cfg, atlas);
        if (res.failure()) throw std::runtime_error(res.message);
    }
};

static std::vector<int> labels(const CollectingSink& sink) {
    std::vector<int> out;
    for (const FrameBuffer& frame : sink.frames) {
        out.push_back(frame.get_pixel(0, 0).r);
    }
    return out;
}

static std::vector<int> expected_labels(int count) {
    std::vector<int> out;
    for (int i = 0; i < count; ++i) out.push_back(LabeledSource::label(i));
    return out;
}

TEST(worker_pool_map_preserves_order) {
    WorkerPool pool(4);
    std::vector<int> inputs;
    for (int i = 0; i < 20; ++i) inputs.push_back(i);

    std::vector<int> squares = pool.map(inputs, [](const int& v) {
        std::this_thread::sleep_for(std::chrono::milliseconds((20 - v) % 5));
        return v * v;
    });

    assert(squares.size() == inputs.size());
    for (int i = 0; i < 20; ++i) {
        assert(squares[i] == i * i);
    }
}

TEST(worker_pool_map_rethrows) {
    WorkerPool pool(3);
    std::vector<int> inputs = {0, 1, 2, 3, 4};

    bool threw = false;
    try {
        pool.map(inputs, [](const int& v) {
            if (v == 3) throw std::runtime_error("bad input");
            return v;
        });
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()) == "bad input";
    }
    assert(threw);

    auto after = pool.submit([] { return 7; });
    assert(after.get() == 7);
}

TEST(parallel_batches_keep_order) {
    Harness h(3);
    Compositor compositor(h.atlas, h.rasterizer, h.config);
    FramePipeline pipeline(compositor);

    LabeledSource source(10, 24);
    CollectingSink sink;
    assert(source.open(""));

    Result res = pipeline.run(source, sink);
    assert(res.success());
    assert(labels(sink) == expected_labels(10));
    assert(pipeline.stats().frames == 10);
    assert(pipeline.stats().batches == 4);

    // The parallel path always draws with the exact policy.
    assert(sink.size == (Size{16, 16}));
    assert(sink.open_calls == 1);
    assert(sink.fps == 10.0);
    assert(sink.closed);
}

TEST(sequential_run_uses_configured_policy) {
    Harness h(1);
    Compositor compositor(h.atlas, h.rasterizer, h.config);
    FramePipeline pipeline(compositor);

    LabeledSource source(7, 24);
    CollectingSink sink;
    assert(source.open(""));

    assert(pipeline.run(source, sink).success());
    assert(labels(sink) == expected_labels(7));
    assert(sink.size == (Size{24, 24}));
    assert(pipeline.stats().batches == 0);
    assert(sink.closed);
}

TEST(worker_failure_is_fatal) {
    Harness h(3);
    Compositor compositor(h.atlas, h.rasterizer, h.config);
    FramePipeline pipeline(compositor);

    LabeledSource source(10, 24);
    source.shrink_frame(5);
    CollectingSink sink;
    assert(source.open(""));

    Result res = pipeline.run(source, sink);
    assert(res.error == ErrorCode::PROCESSING_ERROR);
    // Only the batch before the failing one reached the sink.
    assert(labels(sink) == expected_labels(3));
    assert(sink.closed);
}

TEST(worker_pool_drains_queue_on_destruction) {
    std::atomic<int> done{0};
    {
        WorkerPool pool(64);
        assert(pool.size() == 64);
        for (int i = 0; i < 256; ++i) {
            pool.submit([&done] { done.fetch_add(1); });
        }
    }
    assert(done.load() == 256);
}

TEST(decode_failure_is_fatal) {
    for (int workers : {1, 3}) {
        Harness h(workers);
        Compositor compositor(h.atlas, h.rasterizer, h.config);
        FramePipeline pipeline(compositor);

        LabeledSource source(10, 24);
        source.fail_after(4);
        CollectingSink sink;
        assert(source.open(""));

        Result res = pipeline.run(source, sink);
        assert(res.error == ErrorCode::INVALID_FORMAT);
        // Frames decoded before the error are still written.
        assert(labels(sink) == expected_labels(4));
        assert(pipeline.stats().frames == 4);
        assert(sink.closed);
    }
}

TEST(decode_failure_before_first_frame) {
    Harness h(2);
    Compositor compositor(h.atlas, h.rasterizer, h.config);
    FramePipeline pipeline(compositor);

    LabeledSource source(5, 24);
    source.fail_after(0);
    CollectingSink sink;
    assert(source.open(""));

    assert(pipeline.run(source, sink).error == ErrorCode::INVALID_FORMAT);
    assert(sink.open_calls == 0);
}

TEST(frame_size_change_is_rejected) {
    for (int workers : {1, 3}) {
        Harness h(workers);
        Compositor compositor(h.atlas, h.rasterizer, h.config);
        FramePipeline pipeline(compositor);

        // 24x24, then 40x40, then 24x24 again.
        LabeledSource source(3, 24);
        source.grow_frame(1);
        CollectingSink sink;
        assert(source.open(""));

        Result res = pipeline.run(source, sink);
        assert(res.error == ErrorCode::IO_ERROR);
        assert(sink.frames.size() == 1);
        assert(sink.open_calls == 1);
        assert(sink.size == (workers == 1 ? Size{24, 24} : Size{16, 16}));
        assert(sink.closed);
    }
}

TEST(progress_reports_expected_total) {
    Harness h(2);
    Compositor compositor(h.atlas, h.rasterizer, h.config);
    FramePipeline pipeline(compositor);

    // Metadata promises 12 frames but the stream holds 5.
    LabeledSource source(5, 24, 4.0, 3.0);
    CollectingSink sink;
    assert(source.open(""));

    std::vector<int> seen;
    int expected_seen = 0;
    pipeline.set_progress_callback([&](int done, int expected) {
        seen.push_back(done);
        expected_seen = expected;
    });

    assert(pipeline.run(source, sink).success());
    assert(expected_seen == 12);
    assert((seen == std::vector<int>{1, 2, 3, 4, 5}));
    assert(sink.frames.size() == 5);
}

TEST(empty_stream_fails) {
    Harness h(0);
    Compositor compositor(h.atlas, h.rasterizer, h.config);
    FramePipeline pipeline(compositor);

    LabeledSource source(0, 24);
    CollectingSink sink;
    assert(source.open(""));
    assert(pipeline.run(source, sink).error == ErrorCode::INVALID_FORMAT);
    assert(sink.open_calls == 0);
}

TEST(expected_frames_rounds_half_up) {
    assert(LabeledSource(1, 8, 29.97, 10.0).expected_frames() == 300);
    assert(LabeledSource(1, 8, 10.0, 1.25).expected_frames() == 13);
    assert(LabeledSource(1, 8, 24.0, 0.0).expected_frames() == 0);
}

TEST(noise_source_frame_count_and_seed) {
    NoiseSource::Config cfg;
    cfg.width = 12;
    cfg.height = 9;
    cfg.fps = 10.0;
    cfg.duration = 1.25;
    cfg.seed = 42;

    NoiseSource a(cfg);
    NoiseSource b(cfg);
    assert(a.open(""));
    assert(b.open(""));
    assert(a.total_frames() == 13);

    FrameBuffer fa, fb;
    int count = 0;
    bool varied = false;
    while (a.read(fa)) {
        assert(b.read(fb));
        assert(fa == fb);
        assert(fa.width() == 12 && fa.height() == 9);
        for (size_t i = 0; i < fa.byte_size(); ++i) {
            assert(fa.data()[i] <= 254);
            if (fa.data()[i] != fa.data()[0]) varied = true;
        }
        ++count;
    }
    assert(count == 13);
    assert(varied);
    assert(!b.read(fb));

    a.reset();
    FrameBuffer again;
    assert(a.read(again));
    NoiseSource c(cfg);
    assert(c.open(""));
    FrameBuffer first;
    assert(c.read(first));
    assert(again == first);
}

TEST(noise_still_runs_once) {
    Harness h(4);
    Compositor compositor(h.atlas, h.rasterizer, h.config);
    FramePipeline pipeline(compositor);

    NoiseSource::Config cfg;
    cfg.width = 40;
    cfg.height = 32;
    cfg.still = true;
    NoiseSource source(cfg);
    assert(source.open(""));
    assert(source.expected_frames() == 1);

    CollectingSink sink;
    assert(pipeline.run(source, sink).success());
    assert(sink.frames.size() == 1);
    // Still images use the configured policy even with several workers.
    assert(sink.size == (Size{40, 32}));
}

TEST(source_selection) {
    assert(is_image_path("photo.PNG"));
    assert(is_image_path("a/b/c.jpeg"));
    assert(!is_image_path("clip.mp4"));

    Config config = Config::defaults();
    config.input = "clip.mp4";
    config.output = "out.mp4";
    assert(dynamic_cast<VideoFileSource*>(create_source(config).get()) != nullptr);

    config.output = "frame.png";
    assert(dynamic_cast<ImageSource*>(create_source(config).get()) != nullptr);

    config.random.enabled = true;
    auto noise = create_source(config);
    assert(dynamic_cast<NoiseSource*>(noise.get()) != nullptr);
    assert(noise->is_still());

    config.output = "noise.mp4";
    assert(!create_source(config)->is_still());
}

TEST(open_source_reports_missing_file) {
    ImageSource source;
    Result res = open_source(source, "/nonexistent/ascii-media/input.png");
    assert(res.error == ErrorCode::FILE_NOT_FOUND);
}

int main() {
    std::cout << "=== Frame Pipeline Tests ===\n\n";

    std::cout << "--- Worker Pool ---\n";
    RUN_TEST(worker_pool_map_preserves_order);
    RUN_TEST(worker_pool_map_rethrows);
    RUN_TEST(worker_pool_drains_queue_on_destruction);

    std::cout << "\n--- Pipeline ---\n";
    RUN_TEST(parallel_batches_keep_order);
    RUN_TEST(sequential_run_uses_configured_policy);
    RUN_TEST(worker_failure_is_fatal);
    RUN_TEST(decode_failure_is_fatal);
    RUN_TEST(decode_failure_before_first_frame);
    RUN_TEST(frame_size_change_is_rejected);
    RUN_TEST(progress_reports_expected_total);
    RUN_TEST(empty_stream_fails);

    std::cout << "\n--- Sources ---\n";
    RUN_TEST(expected_frames_rounds_half_up);
    RUN_TEST(noise_source_frame_count_and_seed);
    RUN_TEST(noise_still_runs_once);
    RUN_TEST(source_selection);
    RUN_TEST(open_source_reports_missing_file);

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
