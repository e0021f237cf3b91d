#pragma once

#include "core/types.hpp"
#include <string>
#include <memory>
#include <random>
#include <cstdint>
#ifdef ASCIIMEDIA_USE_OPENCV
#include <opencv2/opencv.hpp>
#endif

namespace asciimedia {

struct Config;

class FrameSource {
public:
    virtual ~FrameSource() = default;
    virtual bool open(const std::string& uri) = 0;
    virtual bool read(FrameBuffer& out) = 0;
    virtual double fps() const = 0;
    // Seconds; zero when unknown or for still images.
    virtual double duration() const = 0;
    virtual bool is_open() const = 0;
    virtual bool is_still() const { return false; }
    // True once read() has stopped because the input could not be decoded,
    // as opposed to reaching its end.
    virtual bool failed() const { return false; }

    // Estimated from metadata, used for progress only. The stream may end
    // before or after this count.
    int expected_frames() const;

protected:
#ifdef ASCIIMEDIA_USE_OPENCV
    void convert_mat_to_framebuffer(const cv::Mat& mat, FrameBuffer& out);
#endif
};

class VideoFileSource : public FrameSource {
public:
    VideoFileSource();
    ~VideoFileSource() override;

    bool open(const std::string& uri) override;
    bool read(FrameBuffer& out) override;
    double fps() const override;
    double duration() const override;
    bool is_open() const override;
    bool failed() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    double fps_ = 30.0;
    double duration_ = 0.0;
};

class ImageSource : public FrameSource {
public:
    ImageSource();
    ~ImageSource() override;

    bool open(const std::string& uri) override;
    bool read(FrameBuffer& out) override;
    double fps() const override;
    double duration() const override;
    bool is_open() const override;
    bool is_still() const override { return true; }

private:
    FrameBuffer image_;
    bool loaded_ = false;
    bool sent_ = false;
};

// Uniformly random RGB frames in place of decoded media.
class NoiseSource : public FrameSource {
public:
    struct Config {
        int width = 1920;
        int height = 1080;
        double fps = 30.0;
        double duration = 10.0;
        uint32_t seed = 0;
        bool still = false;
    };

    explicit NoiseSource(const Config& config);

    // The uri is ignored; nothing is read from disk.
    bool open(const std::string& uri) override;
    bool read(FrameBuffer& out) override;
    double fps() const override { return config_.fps; }
    double duration() const override { return config_.still ? 0.0 : config_.duration; }
    bool is_open() const override { return opened_; }
    bool is_still() const override { return config_.still; }

    // Restarts the sequence from the seed.
    void reset();

    int total_frames() const { return total_; }

private:
    Config config_;
    std::mt19937 rng_;
    int total_ = 0;
    int produced_ = 0;
    bool opened_ = false;
};

bool is_image_path(const std::string& path);

// Image mode is chosen when either the input or the output is an image.
std::unique_ptr<FrameSource> create_source(const Config& config);

// Opens `source`, telling a missing file apart from an undecodable one.
Result open_source(FrameSource& source, const std::string& uri);

}
