#include "frame_sink.hpp"
#include "core/config.hpp"
#include "render/image_writer.hpp"
#include "render/video_encoder.hpp"

namespace asciimedia {

std::unique_ptr<FrameSink> create_sink(const Config& config, bool still) {
    if (still) {
        return std::make_unique<ImageWriter>(config.output);
    }

    VideoEncoder::Config encoder;
    encoder.codec = config.encode.codec;
    encoder.bitrate = config.encode.bitrate;
    if (config.encode.audio && !config.random.enabled) {
        encoder.audio_source = config.input;
    }
    return std::make_unique<VideoEncoder>(config.output, encoder);
}

}
