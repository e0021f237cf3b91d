#pragma once

#include "core/types.hpp"
#include "render/frame_sink.hpp"
#include <string>
#include <memory>

extern "C" {
struct AVFormatContext;
struct AVCodecContext;
struct AVStream;
struct AVFrame;
struct AVPacket;
struct SwsContext;
}

namespace asciimedia {

class VideoEncoder : public FrameSink {
public:
    struct Config {
        int bitrate = 8000000;
        std::string codec = "libx264";
        std::string preset = "medium";
        // Media whose first audio stream is copied into the output; empty
        // for silent output.
        std::string audio_source;
    };

    VideoEncoder(const std::string& filename, const Config& config);
    ~VideoEncoder() override;

    Result open(int width, int height, double fps) override;
    Result write(const FrameBuffer& frame) override;
    Result close() override;
    bool is_open() const override { return format_ctx_ != nullptr; }

    // 4:2:0 formats need even dimensions; an odd width or height loses its
    // last column or row.
    static Size encoded_size(int width, int height);

private:
    bool init_codec();
    bool init_audio();
    bool drain_packets();
    bool copy_audio();
    void release();

    std::string filename_;
    Config config_;
    Size input_size_;
    int width_ = 0;
    int height_ = 0;
    double fps_ = 30.0;

    AVFormatContext* format_ctx_ = nullptr;
    AVCodecContext* codec_ctx_ = nullptr;
    AVStream* stream_ = nullptr;
    AVFrame* frame_ = nullptr;
    AVPacket* pkt_ = nullptr;
    SwsContext* sws_ctx_ = nullptr;
    int64_t pts_ = 0;
    bool output_is_gif_ = false;

    AVFormatContext* audio_in_ = nullptr;
    AVStream* audio_out_ = nullptr;
    int audio_stream_idx_ = -1;
};

}
