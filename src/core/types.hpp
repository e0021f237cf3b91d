#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>
#include <algorithm>
#include <string>

namespace asciimedia {

enum class ErrorCode {
    SUCCESS = 0,
    FILE_NOT_FOUND,
    INVALID_FORMAT,
    MEMORY_ERROR,
    PROCESSING_ERROR,
    FONT_ERROR,
    INVALID_ARGUMENT,
    IO_ERROR
};

struct Result {
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;

    bool success() const { return error == ErrorCode::SUCCESS; }
    bool failure() const { return error != ErrorCode::SUCCESS; }

    static Result ok() { return {ErrorCode::SUCCESS, ""}; }
    static Result fail(ErrorCode code, const std::string& msg) { return {code, msg}; }
};

struct Size {
    int width = 0;
    int height = 0;

    bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }
    bool operator!=(const Size& other) const { return !(*this == other); }
    int area() const { return width * height; }
};

struct Color {
    uint8_t r = 0, g = 0, b = 0;

    Color() = default;
    Color(uint8_t r, uint8_t g, uint8_t b) : r(r), g(g), b(b) {}

    static Color gray(uint8_t v) { return Color(v, v, v); }

    Color inverted() const {
        return Color(static_cast<uint8_t>(255 - r),
                     static_cast<uint8_t>(255 - g),
                     static_cast<uint8_t>(255 - b));
    }

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

// Packed RGB24, row-major, origin top-left.
class FrameBuffer {
public:
    static constexpr int kChannels = 3;

    FrameBuffer() = default;
    FrameBuffer(int w, int h)
        : width_(w), height_(h), data_(static_cast<size_t>(w) * h * kChannels, 0) {}
    FrameBuffer(int w, int h, const Color& fill) : FrameBuffer(w, h) {
        this->fill(fill);
    }

    int width() const { return width_; }
    int height() const { return height_; }
    Size size() const { return {width_, height_}; }
    bool empty() const { return width_ == 0 || height_ == 0; }
    size_t byte_size() const { return data_.size(); }
    size_t stride() const { return static_cast<size_t>(width_) * kChannels; }
    const uint8_t* data() const { return data_.data(); }
    uint8_t* data() { return data_.data(); }

    const uint8_t* row(int y) const { return data_.data() + static_cast<size_t>(y) * stride(); }
    uint8_t* row(int y) { return data_.data() + static_cast<size_t>(y) * stride(); }

    Color get_pixel(int x, int y) const {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return Color();
        const uint8_t* px = row(y) + static_cast<size_t>(x) * kChannels;
        return Color(px[0], px[1], px[2]);
    }

    void set_pixel(int x, int y, const Color& c) {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return;
        uint8_t* px = row(y) + static_cast<size_t>(x) * kChannels;
        px[0] = c.r;
        px[1] = c.g;
        px[2] = c.b;
    }

    void fill(const Color& c) {
        for (size_t i = 0; i < data_.size(); i += kChannels) {
            data_[i] = c.r;
            data_[i + 1] = c.g;
            data_[i + 2] = c.b;
        }
    }

    void clear() {
        std::fill(data_.begin(), data_.end(), 0);
    }

    bool operator==(const FrameBuffer& other) const {
        return width_ == other.width_ && height_ == other.height_ && data_ == other.data_;
    }
    bool operator!=(const FrameBuffer& other) const { return !(*this == other); }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<uint8_t> data_;
};

class FloatImage {
public:
    FloatImage() = default;
    FloatImage(int w, int h) : width_(w), height_(h), data_(static_cast<size_t>(w) * h, 0.0f) {}
    FloatImage(int w, int h, float fill) : width_(w), height_(h), data_(static_cast<size_t>(w) * h, fill) {}

    int width() const { return width_; }
    int height() const { return height_; }
    Size size() const { return {width_, height_}; }
    bool empty() const { return width_ == 0 || height_ == 0; }
    size_t size_in_elements() const { return data_.size(); }
    const float* data() const { return data_.data(); }
    float* data() { return data_.data(); }

    const float* row(int y) const { return data_.data() + static_cast<size_t>(y) * width_; }

    float get(int x, int y) const {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return 0.0f;
        return data_[static_cast<size_t>(y) * width_ + x];
    }

    void set(int x, int y, float v) {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return;
        data_[static_cast<size_t>(y) * width_ + x] = v;
    }

    void fill(float v) {
        std::fill(data_.begin(), data_.end(), v);
    }

    float sum() const {
        float total = 0.0f;
        for (float v : data_) total += v;
        return total;
    }

    // Top-left sub-rectangle, clamped to the current extent.
    FloatImage cropped(int w, int h) const {
        w = std::clamp(w, 0, width_);
        h = std::clamp(h, 0, height_);
        FloatImage out(w, h);
        for (int y = 0; y < h; ++y) {
            std::copy(row(y), row(y) + w, out.data_.begin() + static_cast<size_t>(y) * w);
        }
        return out;
    }

    bool operator==(const FloatImage& other) const {
        return width_ == other.width_ && height_ == other.height_ && data_ == other.data_;
    }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<float> data_;
};

}
