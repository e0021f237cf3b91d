#include "video_encoder.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <iostream>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/opt.h>
#include <libavutil/pixfmt.h>
#include <libavutil/rational.h>
#include <libswscale/swscale.h>
}

namespace asciimedia {

namespace {

bool is_gif_path(std::string path) {
    for (char& c : path) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return path.ends_with(".gif");
}

AVPixelFormat choose_pixel_format(const AVCodec* codec, bool gif_output) {
    const AVPixelFormat fallback = gif_output ? AV_PIX_FMT_RGB8 : AV_PIX_FMT_YUV420P;
    if (!codec) {
        return fallback;
    }

    const void* raw_formats = nullptr;
    int num_formats = 0;
    const int ret = avcodec_get_supported_config(
        nullptr, codec, AV_CODEC_CONFIG_PIX_FORMAT, 0, &raw_formats, &num_formats);
    if (ret < 0 || !raw_formats || num_formats <= 0) {
        return fallback;
    }

    const auto* pix_fmts = static_cast<const AVPixelFormat*>(raw_formats);
    auto has_format = [&](AVPixelFormat fmt) -> bool {
        for (int i = 0; i < num_formats; ++i) {
            if (pix_fmts[i] == fmt) {
                return true;
            }
        }
        return false;
    };

    if (gif_output) {
        const AVPixelFormat preferred[] = {
            AV_PIX_FMT_RGB8,
            AV_PIX_FMT_BGR8,
            AV_PIX_FMT_PAL8
        };
        for (AVPixelFormat pf : preferred) {
            if (has_format(pf)) {
                return pf;
            }
        }
    } else if (has_format(AV_PIX_FMT_YUV420P)) {
        return AV_PIX_FMT_YUV420P;
    }

    return pix_fmts[0];
}

void push_codec_candidate(std::vector<const AVCodec*>& out, const AVCodec* codec) {
    if (!codec) {
        return;
    }
    for (const AVCodec* existing : out) {
        if (existing && codec->name && existing->name &&
            std::strcmp(existing->name, codec->name) == 0) {
            return;
        }
    }
    out.push_back(codec);
}

}  // namespace

VideoEncoder::VideoEncoder(const std::string& filename, const Config& config)
    : filename_(filename), config_(config) {}

VideoEncoder::~VideoEncoder() {
    if (is_open()) {
        Result closed = close();
        if (closed.failure()) {
            std::cerr << "Warning: " << closed.message << "\n";
        }
    }
    release();
}

Size VideoEncoder::encoded_size(int width, int height) {
    return {width - (width % 2), height - (height % 2)};
}

Result VideoEncoder::open(int width, int height, double fps) {
    release();
    output_is_gif_ = is_gif_path(filename_);

    Size size = output_is_gif_ ? Size{width, height} : encoded_size(width, height);
    if (size.width <= 0 || size.height <= 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT,
                            "Cannot encode a " + std::to_string(width) + "x" + std::to_string(height) + " video");
    }
    input_size_ = {width, height};
    width_ = size.width;
    height_ = size.height;
    fps_ = fps > 0.0 ? fps : 30.0;

    int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, nullptr, filename_.c_str());
    if (ret < 0 || !format_ctx_) {
        format_ctx_ = nullptr;
        return Result::fail(ErrorCode::IO_ERROR, "Unsupported output container: " + filename_);
    }

    if (!init_codec()) {
        release();
        return Result::fail(ErrorCode::IO_ERROR, "No usable video encoder for " + filename_);
    }

    if (!config_.audio_source.empty() && !output_is_gif_ && !init_audio()) {
        std::cerr << "Warning: Audio from " << config_.audio_source << " will not be copied\n";
    }

    if (!(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
        ret = avio_open(&format_ctx_->pb, filename_.c_str(), AVIO_FLAG_WRITE);
        if (ret < 0) {
            release();
            return Result::fail(ErrorCode::IO_ERROR, "Failed to open output file: " + filename_);
        }
    }

    if (avformat_write_header(format_ctx_, nullptr) < 0) {
        release();
        return Result::fail(ErrorCode::IO_ERROR, "Failed to write container header: " + filename_);
    }
    return Result::ok();
}

Result VideoEncoder::write(const FrameBuffer& frame) {
    if (!is_open() || !frame_) {
        return Result::fail(ErrorCode::IO_ERROR, "Video encoder is not open");
    }

    if (frame.size() != input_size_) {
        return Result::fail(ErrorCode::IO_ERROR,
                            "Frame is " + std::to_string(frame.width()) + "x" + std::to_string(frame.height()) +
                            " but the encoder was opened at " + std::to_string(input_size_.width) + "x" +
                            std::to_string(input_size_.height));
    }

    if (av_frame_make_writable(frame_) < 0) {
        return Result::fail(ErrorCode::MEMORY_ERROR, "Encoder frame is not writable");
    }

    // Same source and target size: only the pixel format changes. Reading the
    // top-left width_ x height_ of the frame through its full stride drops an
    // odd trailing column and row without resampling the glyphs.
    if (!sws_ctx_) {
        sws_ctx_ = sws_getContext(
            width_, height_, AV_PIX_FMT_RGB24,
            width_, height_, codec_ctx_->pix_fmt,
            SWS_POINT, nullptr, nullptr, nullptr
        );
        if (!sws_ctx_) {
            return Result::fail(ErrorCode::PROCESSING_ERROR, "Failed to create color converter");
        }
    }

    const uint8_t* src_data[1] = { frame.data() };
    int src_linesize[1] = { static_cast<int>(frame.stride()) };

    sws_scale(sws_ctx_, src_data, src_linesize, 0, height_,
              frame_->data, frame_->linesize);

    frame_->pts = pts_++;

    if (avcodec_send_frame(codec_ctx_, frame_) < 0 || !drain_packets()) {
        return Result::fail(ErrorCode::IO_ERROR, "Failed to encode frame " + std::to_string(pts_ - 1));
    }
    return Result::ok();
}

Result VideoEncoder::close() {
    if (!is_open()) return Result::ok();

    bool ok = true;
    if (codec_ctx_) {
        avcodec_send_frame(codec_ctx_, nullptr);
        ok = drain_packets();
    }
    if (ok && audio_in_) {
        ok = copy_audio();
    }
    if (av_write_trailer(format_ctx_) < 0) {
        ok = false;
    }
    release();

    if (!ok) {
        return Result::fail(ErrorCode::IO_ERROR, "Failed to finalize " + filename_);
    }
    return Result::ok();
}

void VideoEncoder::release() {
    if (codec_ctx_) {
        avcodec_free_context(&codec_ctx_);
    }
    if (format_ctx_) {
        if (format_ctx_->pb && !(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
            avio_closep(&format_ctx_->pb);
        }
        avformat_free_context(format_ctx_);
        format_ctx_ = nullptr;
    }
    if (audio_in_) {
        avformat_close_input(&audio_in_);
    }
    if (frame_) {
        av_frame_free(&frame_);
    }
    if (pkt_) {
        av_packet_free(&pkt_);
    }
    if (sws_ctx_) {
        sws_freeContext(sws_ctx_);
        sws_ctx_ = nullptr;
    }

    stream_ = nullptr;
    audio_out_ = nullptr;
    audio_stream_idx_ = -1;
    pts_ = 0;
    input_size_ = Size{};
}

bool VideoEncoder::drain_packets() {
    while (true) {
        int ret = avcodec_receive_packet(codec_ctx_, pkt_);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return true;
        if (ret < 0) return false;

        av_packet_rescale_ts(pkt_, codec_ctx_->time_base, stream_->time_base);
        pkt_->stream_index = stream_->index;

        if (av_interleaved_write_frame(format_ctx_, pkt_) < 0) return false;
    }
}

bool VideoEncoder::init_codec() {
    std::vector<const AVCodec*> candidates;
    if (output_is_gif_) {
        push_codec_candidate(candidates, avcodec_find_encoder(AV_CODEC_ID_GIF));
    } else {
        push_codec_candidate(candidates, avcodec_find_encoder_by_name(config_.codec.c_str()));
        push_codec_candidate(candidates, avcodec_find_encoder_by_name("libx264"));
        push_codec_candidate(candidates, avcodec_find_encoder_by_name("libopenh264"));
        push_codec_candidate(candidates, avcodec_find_encoder_by_name("mpeg4"));
        push_codec_candidate(candidates, avcodec_find_encoder(AV_CODEC_ID_MPEG4));
        push_codec_candidate(candidates, avcodec_find_encoder(AV_CODEC_ID_H264));
    }
    if (candidates.empty()) {
        return false;
    }

    const AVRational frame_rate = av_d2q(fps_, 100000);

    const AVCodec* opened_codec = nullptr;
    for (const AVCodec* codec : candidates) {
        codec_ctx_ = avcodec_alloc_context3(codec);
        if (!codec_ctx_) {
            continue;
        }

        codec_ctx_->width = width_;
        codec_ctx_->height = height_;
        codec_ctx_->time_base = av_inv_q(frame_rate);
        codec_ctx_->framerate = frame_rate;
        codec_ctx_->pix_fmt = choose_pixel_format(codec, output_is_gif_);
        codec_ctx_->gop_size = std::max(1, static_cast<int>(fps_ + 0.5));
        if (!output_is_gif_) {
            codec_ctx_->bit_rate = config_.bitrate;
        }

        if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
            codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
        }

        if (!output_is_gif_ && codec->name && std::strcmp(codec->name, "libx264") == 0) {
            av_opt_set(codec_ctx_->priv_data, "preset", config_.preset.c_str(), 0);
        }

        if (avcodec_open2(codec_ctx_, codec, nullptr) >= 0) {
            opened_codec = codec;
            break;
        }
        avcodec_free_context(&codec_ctx_);
    }
    if (!opened_codec || !codec_ctx_) {
        return false;
    }

    stream_ = avformat_new_stream(format_ctx_, nullptr);
    if (!stream_) return false;

    stream_->time_base = codec_ctx_->time_base;
    if (avcodec_parameters_from_context(stream_->codecpar, codec_ctx_) < 0) return false;

    frame_ = av_frame_alloc();
    if (!frame_) return false;

    frame_->format = codec_ctx_->pix_fmt;
    frame_->width = codec_ctx_->width;
    frame_->height = codec_ctx_->height;

    if (av_frame_get_buffer(frame_, 0) < 0) return false;

    pkt_ = av_packet_alloc();
    return pkt_ != nullptr;
}

bool VideoEncoder::init_audio() {
    if (avformat_open_input(&audio_in_, config_.audio_source.c_str(), nullptr, nullptr) < 0) {
        audio_in_ = nullptr;
        return false;
    }
    if (avformat_find_stream_info(audio_in_, nullptr) < 0) {
        avformat_close_input(&audio_in_);
        return false;
    }

    audio_stream_idx_ = av_find_best_stream(audio_in_, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audio_stream_idx_ < 0) {
        // Silent source; nothing to copy.
        avformat_close_input(&audio_in_);
        audio_stream_idx_ = -1;
        return true;
    }

    const AVStream* in = audio_in_->streams[audio_stream_idx_];
    if (avformat_query_codec(format_ctx_->oformat, in->codecpar->codec_id, FF_COMPLIANCE_NORMAL) != 1) {
        avformat_close_input(&audio_in_);
        audio_stream_idx_ = -1;
        return false;
    }

    audio_out_ = avformat_new_stream(format_ctx_, nullptr);
    if (!audio_out_ || avcodec_parameters_copy(audio_out_->codecpar, in->codecpar) < 0) {
        avformat_close_input(&audio_in_);
        audio_stream_idx_ = -1;
        return false;
    }
    audio_out_->codecpar->codec_tag = 0;
    audio_out_->time_base = in->time_base;
    return true;
}

bool VideoEncoder::copy_audio() {
    if (!audio_in_ || !audio_out_) return true;

    const AVRational in_tb = audio_in_->streams[audio_stream_idx_]->time_base;
    while (av_read_frame(audio_in_, pkt_) >= 0) {
        if (pkt_->stream_index != audio_stream_idx_) {
            av_packet_unref(pkt_);
            continue;
        }
        av_packet_rescale_ts(pkt_, in_tb, audio_out_->time_base);
        pkt_->stream_index = audio_out_->index;
        pkt_->pos = -1;
        if (av_interleaved_write_frame(format_ctx_, pkt_) < 0) {
            return false;
        }
    }
    return true;
}

}
