#include "frame_source.hpp"
#include "core/config.hpp"

#include <cctype>
#include <cstring>
#include <filesystem>

#ifndef ASCIIMEDIA_USE_OPENCV
#define STB_IMAGE_IMPLEMENTATION
#define STBI_NO_THREAD_LOCAL
#include <stb_image.h>
#endif

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libswscale/swscale.h>
}

namespace asciimedia {

int FrameSource::expected_frames() const {
    if (is_still()) return 1;
    return static_cast<int>(fps() * duration() + 0.5);
}

#ifdef ASCIIMEDIA_USE_OPENCV
void FrameSource::convert_mat_to_framebuffer(const cv::Mat& mat, FrameBuffer& out) {
    if (mat.empty()) return;

    cv::Mat rgb_mat;
    if (mat.channels() == 3) {
        cv::cvtColor(mat, rgb_mat, cv::COLOR_BGR2RGB);
    } else if (mat.channels() == 4) {
        cv::cvtColor(mat, rgb_mat, cv::COLOR_BGRA2RGB);
    } else if (mat.channels() == 1) {
        cv::cvtColor(mat, rgb_mat, cv::COLOR_GRAY2RGB);
    } else {
        return;
    }

    if (out.width() != rgb_mat.cols || out.height() != rgb_mat.rows) {
        out = FrameBuffer(rgb_mat.cols, rgb_mat.rows);
    }
    for (int y = 0; y < rgb_mat.rows; ++y) {
        std::memcpy(out.row(y), rgb_mat.ptr<uint8_t>(y), out.stride());
    }
}
#endif

namespace {

std::string to_lower_copy(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// Container duration is the fallback when the stream does not carry one.
double stream_duration(const AVFormatContext* format_ctx, const AVStream* stream) {
    if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
        return static_cast<double>(stream->duration) * av_q2d(stream->time_base);
    }
    if (format_ctx->duration != AV_NOPTS_VALUE && format_ctx->duration > 0) {
        return static_cast<double>(format_ctx->duration) / AV_TIME_BASE;
    }
    return 0.0;
}

double stream_fps(const AVStream* stream) {
    AVRational rate = stream->avg_frame_rate.num > 0 ? stream->avg_frame_rate : stream->r_frame_rate;
    if (rate.num <= 0 || rate.den <= 0) return 30.0;
    return av_q2d(rate);
}

#ifndef ASCIIMEDIA_USE_OPENCV
bool decode_image_file(const std::string& uri, FrameBuffer& out) {
    int w = 0, h = 0, channels = 0;
    unsigned char* data = stbi_load(uri.c_str(), &w, &h, &channels, FrameBuffer::kChannels);
    if (!data) {
        return false;
    }
    if (w <= 0 || h <= 0) {
        stbi_image_free(data);
        return false;
    }

    out = FrameBuffer(w, h);
    std::memcpy(out.data(), data, out.byte_size());
    stbi_image_free(data);
    return true;
}
#endif

}  // namespace

bool is_image_path(const std::string& path) {
    std::string lower = to_lower_copy(path);
    return lower.ends_with(".png") || lower.ends_with(".jpg") ||
           lower.ends_with(".jpeg") || lower.ends_with(".bmp") ||
           lower.ends_with(".tga") || lower.ends_with(".tiff") ||
           lower.ends_with(".tif") || lower.ends_with(".webp") ||
           lower.ends_with(".ppm") || lower.ends_with(".pgm");
}

// Demuxer, decoder and RGB converter for the best video stream of a file.
struct VideoFileSource::Impl {
    AVFormatContext* format = nullptr;
    AVCodecContext* decoder = nullptr;
    AVPacket* packet = nullptr;
    AVFrame* decoded = nullptr;
    SwsContext* to_rgb = nullptr;
    int stream = -1;
    Size scaler_size;
    AVPixelFormat scaler_format = AV_PIX_FMT_NONE;
    bool draining = false;
    bool failed = false;

    ~Impl() { release(); }

    void release() {
        sws_freeContext(to_rgb);
        to_rgb = nullptr;
        av_frame_free(&decoded);
        av_packet_free(&packet);
        avcodec_free_context(&decoder);
        avformat_close_input(&format);
        stream = -1;
        scaler_size = Size{};
        scaler_format = AV_PIX_FMT_NONE;
        draining = false;
        failed = false;
    }

    bool open(const std::string& uri) {
        release();

        AVDictionary* options = nullptr;
        av_dict_set(&options, "probesize", "5000000", 0);
        av_dict_set(&options, "analyzeduration", "5000000", 0);
        const int opened = avformat_open_input(&format, uri.c_str(), nullptr, &options);
        av_dict_free(&options);
        if (opened < 0 || avformat_find_stream_info(format, nullptr) < 0) {
            release();
            return false;
        }

        const AVCodec* codec = nullptr;
        stream = av_find_best_stream(format, AVMEDIA_TYPE_VIDEO, -1, -1, &codec, 0);
        if (stream < 0 || !codec) {
            release();
            return false;
        }

        decoder = avcodec_alloc_context3(codec);
        packet = av_packet_alloc();
        decoded = av_frame_alloc();
        if (!decoder || !packet || !decoded ||
            avcodec_parameters_to_context(decoder, format->streams[stream]->codecpar) < 0 ||
            avcodec_open2(decoder, codec, nullptr) < 0) {
            release();
            return false;
        }
        return true;
    }

    const AVStream* video_stream() const { return format->streams[stream]; }

    // The scaler is rebuilt whenever the decoded size or pixel format changes.
    bool convert(const AVFrame* src, FrameBuffer& out) {
        const Size size{src->width, src->height};
        const auto src_format = static_cast<AVPixelFormat>(src->format);
        if (size.width <= 0 || size.height <= 0) return false;

        if (!to_rgb || size != scaler_size || src_format != scaler_format) {
            sws_freeContext(to_rgb);
            to_rgb = sws_getContext(size.width, size.height, src_format,
                                    size.width, size.height, AV_PIX_FMT_RGB24,
                                    SWS_BILINEAR, nullptr, nullptr, nullptr);
            if (!to_rgb) return false;
            scaler_size = size;
            scaler_format = src_format;
        }

        if (out.size() != size) {
            out = FrameBuffer(size.width, size.height);
        }
        uint8_t* dst[1] = {out.data()};
        const int dst_linesize[1] = {static_cast<int>(out.stride())};
        return sws_scale(to_rgb, src->data, src->linesize, 0, size.height, dst, dst_linesize) == size.height;
    }

    // Sends the next packet of the video stream, or the flush request once
    // the container is exhausted.
    bool feed() {
        while (av_read_frame(format, packet) >= 0) {
            if (packet->stream_index != stream) {
                av_packet_unref(packet);
                continue;
            }
            const int sent = avcodec_send_packet(decoder, packet);
            av_packet_unref(packet);
            return sent >= 0 || sent == AVERROR(EAGAIN);
        }
        draining = true;
        const int flushed = avcodec_send_packet(decoder, nullptr);
        return flushed >= 0 || flushed == AVERROR_EOF;
    }

    // False at the end of the stream; a decode error also sets `failed`.
    bool next(FrameBuffer& out) {
        while (true) {
            const int received = avcodec_receive_frame(decoder, decoded);
            if (received == 0) {
                const bool converted = convert(decoded, out);
                av_frame_unref(decoded);
                failed = !converted;
                return converted;
            }
            if (received == AVERROR_EOF) return false;
            if (received != AVERROR(EAGAIN) || draining || !feed()) {
                failed = true;
                return false;
            }
        }
    }
};

VideoFileSource::VideoFileSource() : impl_(std::make_unique<Impl>()) {}

VideoFileSource::~VideoFileSource() = default;

bool VideoFileSource::open(const std::string& uri) {
    if (!impl_->open(uri)) return false;

    const AVStream* stream = impl_->video_stream();
    fps_ = stream_fps(stream);
    duration_ = stream_duration(impl_->format, stream);
    return true;
}

bool VideoFileSource::read(FrameBuffer& out) {
    return is_open() && !impl_->failed && impl_->next(out);
}

double VideoFileSource::fps() const { return fps_; }
double VideoFileSource::duration() const { return duration_; }
bool VideoFileSource::is_open() const { return impl_->decoder != nullptr; }
bool VideoFileSource::failed() const { return impl_->failed; }

ImageSource::ImageSource() = default;
ImageSource::~ImageSource() = default;

bool ImageSource::open(const std::string& uri) {
    image_ = FrameBuffer();
#ifdef ASCIIMEDIA_USE_OPENCV
    cv::Mat mat = cv::imread(uri, cv::IMREAD_COLOR);
    if (!mat.empty()) {
        convert_mat_to_framebuffer(mat, image_);
    }
    loaded_ = !image_.empty();
#else
    loaded_ = decode_image_file(uri, image_);
#endif
    sent_ = false;
    return loaded_;
}

bool ImageSource::read(FrameBuffer& out) {
    if (sent_ || !loaded_) return false;
    out = image_;
    sent_ = true;
    return true;
}

double ImageSource::fps() const { return 0.0; }
double ImageSource::duration() const { return 0.0; }
bool ImageSource::is_open() const { return loaded_; }

NoiseSource::NoiseSource(const Config& config) : config_(config), rng_(config.seed) {}

bool NoiseSource::open(const std::string& /*uri*/) {
    if (config_.width <= 0 || config_.height <= 0) return false;
    if (!config_.still && (config_.fps <= 0.0 || config_.duration <= 0.0)) return false;
    total_ = expected_frames();
    reset();
    opened_ = true;
    return true;
}

bool NoiseSource::read(FrameBuffer& out) {
    if (!opened_ || produced_ >= total_) return false;

    if (out.width() != config_.width || out.height() != config_.height) {
        out = FrameBuffer(config_.width, config_.height);
    }
    // Upper bound is exclusive, matching numpy's randint(0, 255).
    std::uniform_int_distribution<int> dist(0, 254);
    uint8_t* data = out.data();
    for (size_t i = 0; i < out.byte_size(); ++i) {
        data[i] = static_cast<uint8_t>(dist(rng_));
    }
    ++produced_;
    return true;
}

void NoiseSource::reset() {
    rng_.seed(config_.seed);
    produced_ = 0;
}

std::unique_ptr<FrameSource> create_source(const Config& config) {
    const bool still = is_image_path(config.input) || is_image_path(config.output);

    if (config.random.enabled) {
        NoiseSource::Config noise;
        noise.width = config.random.width;
        noise.height = config.random.height;
        noise.fps = config.random.fps;
        noise.duration = config.random.duration;
        noise.seed = config.random.seed;
        noise.still = still;
        return std::make_unique<NoiseSource>(noise);
    }

    if (still) {
        return std::make_unique<ImageSource>();
    }
    return std::make_unique<VideoFileSource>();
}

Result open_source(FrameSource& source, const std::string& uri) {
    if (source.open(uri)) {
        return Result::ok();
    }
    std::error_code ec;
    if (!uri.empty() && !std::filesystem::exists(std::filesystem::path(uri), ec)) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "Input not found: " + uri);
    }
    return Result::fail(ErrorCode::INVALID_FORMAT, "Failed to decode input: " + uri);
}

}
