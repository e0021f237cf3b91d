#pragma once

#include "core/types.hpp"
#include "render/frame_sink.hpp"
#include <string>

namespace asciimedia {

// Writes a single frame as a still image. The format follows the file
// extension.
class ImageWriter : public FrameSink {
public:
    explicit ImageWriter(const std::string& filename, int jpeg_quality = 95);

    Result open(int width, int height, double fps) override;
    Result write(const FrameBuffer& frame) override;
    Result close() override;
    bool is_open() const override { return opened_; }

    static bool supports(const std::string& filename);

private:
    std::string filename_;
    int jpeg_quality_;
    bool opened_ = false;
    bool written_ = false;
};

}
