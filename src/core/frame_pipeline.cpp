#include "frame_pipeline.hpp"
#include "core/worker_pool.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace asciimedia {

FramePipeline::FramePipeline(const Compositor& compositor)
    : compositor_(compositor), workers_(compositor.config().workers) {}

Result FramePipeline::run(FrameSource& source, FrameSink& sink) {
    stats_ = Stats{};
    sink_size_ = Size{};
    stats_.expected = source.expected_frames();

    auto start = std::chrono::steady_clock::now();
    Result status;
    if (source.is_still()) {
        status = run_still(source, sink);
    } else if (workers_ <= 1) {
        status = run_sequential(source, sink);
    } else {
        status = run_batched(source, sink);
    }
    stats_.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (status.failure()) {
        if (sink.is_open()) {
            Result closed = sink.close();
            if (closed.failure()) {
                std::cerr << "Warning: " << closed.message << "\n";
            }
        }
        return status;
    }
    if (stats_.frames == 0) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "Input produced no frames");
    }
    return sink.close();
}

Result FramePipeline::run_still(FrameSource& source, FrameSink& sink) {
    FrameBuffer frame;
    if (!source.read(frame)) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "Failed to decode image");
    }
    FrameBuffer ascii;
    Result status = compositor_.composite(frame, ascii);
    if (status.failure()) return status;
    return emit(sink, ascii, 0.0);
}

Result FramePipeline::run_sequential(FrameSource& source, FrameSink& sink) {
    FrameBuffer frame;
    FrameBuffer ascii;
    while (source.read(frame)) {
        Result status = compositor_.composite(frame, ascii);
        if (status.failure()) return status;
        status = emit(sink, ascii, source.fps());
        if (status.failure()) return status;
    }
    return end_of_stream(source);
}

Result FramePipeline::run_batched(FrameSource& source, FrameSink& sink) {
    std::vector<FrameBuffer> batch;
    std::vector<FrameBuffer> results;
    batch.reserve(static_cast<size_t>(workers_));

    while (true) {
        batch.clear();
        FrameBuffer frame;
        while (static_cast<int>(batch.size()) < workers_ && source.read(frame)) {
            batch.push_back(std::move(frame));
            frame = FrameBuffer();
        }
        if (batch.empty()) break;
        // A short batch means the source stopped, at its end or on an error.
        const bool drained = static_cast<int>(batch.size()) < workers_;

        Result status = composite_batch(batch, results);
        if (status.failure()) return status;
        ++stats_.batches;

        for (const FrameBuffer& ascii : results) {
            status = emit(sink, ascii, source.fps());
            if (status.failure()) return status;
        }
        if (drained) break;
    }
    return end_of_stream(source);
}

Result FramePipeline::end_of_stream(const FrameSource& source) const {
    if (source.failed()) {
        return Result::fail(ErrorCode::INVALID_FORMAT,
                            "Failed to decode frame " + std::to_string(stats_.frames + 1) + " of the input");
    }
    return Result::ok();
}

Result FramePipeline::composite_batch(const std::vector<FrameBuffer>& batch,
                                      std::vector<FrameBuffer>& out) const {
    const Compositor& compositor = compositor_;
    try {
        WorkerPool pool(static_cast<int>(batch.size()));
        out = pool.map(batch, [&compositor](const FrameBuffer& frame) {
            FrameBuffer ascii;
            Result status = compositor.composite(frame, DrawPolicy::Exact, ascii);
            if (status.failure()) {
                throw std::runtime_error(status.message);
            }
            return ascii;
        });
    } catch (const std::exception& e) {
        return Result::fail(ErrorCode::PROCESSING_ERROR, std::string("Worker failed: ") + e.what());
    }
    return Result::ok();
}

Result FramePipeline::emit(FrameSink& sink, const FrameBuffer& frame, double fps) {
    if (!sink.is_open()) {
        Result opened = sink.open(frame.width(), frame.height(), fps);
        if (opened.failure()) return opened;
        sink_size_ = frame.size();
    } else if (frame.size() != sink_size_) {
        return Result::fail(ErrorCode::IO_ERROR,
                            "Frame " + std::to_string(stats_.frames + 1) + " is " +
                            std::to_string(frame.width()) + "x" + std::to_string(frame.height()) +
                            " but the output was opened at " + std::to_string(sink_size_.width) + "x" +
                            std::to_string(sink_size_.height));
    }
    Result written = sink.write(frame);
    if (written.failure()) return written;

    ++stats_.frames;
    if (progress_) {
        progress_(stats_.frames, stats_.expected);
    }
    return Result::ok();
}

}
