#pragma once

#include "core/types.hpp"
#include <memory>
#include <string>

namespace asciimedia {

struct Config;

// Receives composited frames in presentation order.
class FrameSink {
public:
    virtual ~FrameSink() = default;
    virtual Result open(int width, int height, double fps) = 0;
    virtual Result write(const FrameBuffer& frame) = 0;
    virtual Result close() = 0;
    virtual bool is_open() const = 0;
};

// `still` selects an image writer; otherwise a video encoder that copies the
// audio of `config.input` when enabled.
std::unique_ptr<FrameSink> create_sink(const Config& config, bool still);

}
