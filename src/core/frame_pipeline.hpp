#pragma once

#include "core/types.hpp"
#include "core/frame_source.hpp"
#include "render/compositor.hpp"
#include "render/frame_sink.hpp"
#include <functional>
#include <vector>

namespace asciimedia {

// Pulls frames from a source, composites them and hands them to a sink in
// decode order.
//
// With more than one worker, frames are taken in batches of `workers` and
// drawn with the exact policy on a pool sized to the batch; otherwise each
// frame is drawn with the configured policy as soon as it is decoded.
class FramePipeline {
public:
    struct Stats {
        int frames = 0;
        int expected = 0;
        int batches = 0;
        double seconds = 0.0;
    };

    // Called after every frame reaches the sink.
    using ProgressCallback = std::function<void(int done, int expected)>;

    explicit FramePipeline(const Compositor& compositor);

    void set_progress_callback(ProgressCallback callback) { progress_ = std::move(callback); }

    Result run(FrameSource& source, FrameSink& sink);

    const Stats& stats() const { return stats_; }

private:
    Result run_still(FrameSource& source, FrameSink& sink);
    Result run_sequential(FrameSource& source, FrameSink& sink);
    Result run_batched(FrameSource& source, FrameSink& sink);
    Result composite_batch(const std::vector<FrameBuffer>& batch, std::vector<FrameBuffer>& out) const;
    Result end_of_stream(const FrameSource& source) const;
    // Every frame must match the size the sink was opened with.
    Result emit(FrameSink& sink, const FrameBuffer& frame, double fps);

    const Compositor& compositor_;
    int workers_ = 0;
    ProgressCallback progress_;
    Stats stats_;
    Size sink_size_;
};

}
