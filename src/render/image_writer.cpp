#include "image_writer.hpp"

#include <cctype>
#include <vector>

#ifdef ASCIIMEDIA_USE_OPENCV
#include <opencv2/opencv.hpp>
#else
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>
#endif

namespace asciimedia {

#ifndef ASCIIMEDIA_USE_OPENCV
namespace {

std::string lower_extension(const std::string& filename) {
    size_t dot = filename.find_last_of('.');
    if (dot == std::string::npos) return "";
    std::string ext = filename.substr(dot + 1);
    for (char& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return ext;
}

}
#endif

ImageWriter::ImageWriter(const std::string& filename, int jpeg_quality)
    : filename_(filename), jpeg_quality_(jpeg_quality) {}

bool ImageWriter::supports(const std::string& filename) {
#ifdef ASCIIMEDIA_USE_OPENCV
    return cv::haveImageWriter(filename);
#else
    const std::string ext = lower_extension(filename);
    return ext == "png" || ext == "jpg" || ext == "jpeg" || ext == "bmp" || ext == "tga";
#endif
}

Result ImageWriter::open(int width, int height, double /*fps*/) {
    if (width <= 0 || height <= 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "Cannot write an empty image");
    }
    if (!supports(filename_)) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "Unsupported image format: " + filename_);
    }
    opened_ = true;
    written_ = false;
    return Result::ok();
}

Result ImageWriter::write(const FrameBuffer& frame) {
    if (!opened_) {
        return Result::fail(ErrorCode::IO_ERROR, "Image writer is not open");
    }
    if (written_) {
        return Result::fail(ErrorCode::IO_ERROR, "Image output takes exactly one frame");
    }

    bool ok = false;
#ifdef ASCIIMEDIA_USE_OPENCV
    cv::Mat rgb(frame.height(), frame.width(), CV_8UC3, const_cast<uint8_t*>(frame.data()), frame.stride());
    cv::Mat bgr;
    cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);
    std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, jpeg_quality_};
    ok = cv::imwrite(filename_, bgr, params);
#else
    const std::string ext = lower_extension(filename_);
    const int w = frame.width();
    const int h = frame.height();
    const int comp = FrameBuffer::kChannels;
    if (ext == "png") {
        ok = stbi_write_png(filename_.c_str(), w, h, comp, frame.data(), static_cast<int>(frame.stride())) != 0;
    } else if (ext == "jpg" || ext == "jpeg") {
        ok = stbi_write_jpg(filename_.c_str(), w, h, comp, frame.data(), jpeg_quality_) != 0;
    } else if (ext == "bmp") {
        ok = stbi_write_bmp(filename_.c_str(), w, h, comp, frame.data()) != 0;
    } else if (ext == "tga") {
        ok = stbi_write_tga(filename_.c_str(), w, h, comp, frame.data()) != 0;
    }
#endif

    if (!ok) {
        return Result::fail(ErrorCode::IO_ERROR, "Failed to write image: " + filename_);
    }
    written_ = true;
    return Result::ok();
}

Result ImageWriter::close() {
    opened_ = false;
    return Result::ok();
}

}
