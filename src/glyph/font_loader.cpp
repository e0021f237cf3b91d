#include "font_loader.hpp"

#define STB_TRUETYPE_IMPLEMENTATION
#include <stb_truetype.h>

#include <cmath>
#include <fstream>
#include <algorithm>
#include <cstdlib>
#include <iterator>

namespace asciimedia {

struct FontInfoImpl {
    stbtt_fontinfo info;
};

namespace {

constexpr size_t kMaxFontBytes = 32 * 1024 * 1024;

bool is_safe_font_path(const std::string& path) {
    return !path.empty() && path.size() <= 4096 &&
           path.find("..") == std::string::npos &&
           path.find('\0') == std::string::npos;
}

// TrueType (0x00010000 or 'true') and CFF OpenType ('OTTO') outlines.
bool has_sfnt_signature(const uint8_t* bytes) {
    const uint32_t tag = (static_cast<uint32_t>(bytes[0]) << 24) |
                         (static_cast<uint32_t>(bytes[1]) << 16) |
                         (static_cast<uint32_t>(bytes[2]) << 8) |
                         static_cast<uint32_t>(bytes[3]);
    return tag == 0x00010000 || tag == 0x74727565 || tag == 0x4F54544F;
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

}

std::string FontLoader::find_system_monospace_font() {
    std::vector<std::string> candidates;

    if (const char* home = std::getenv("HOME")) {
        candidates.push_back(std::string(home) + "/.local/share/fonts/DejaVuSansMono.ttf");
        candidates.push_back(std::string(home) + "/.fonts/DejaVuSansMono.ttf");
    }

    static const char* const system_fonts[] = {
        "/usr/share/fonts/truetype/msttcorefonts/cour.ttf",
        "/usr/share/fonts/truetype/msttcorefonts/Courier_New.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationMono-Regular.ttf",
        "/usr/share/fonts/truetype/liberation2/LiberationMono-Regular.ttf",
        "/usr/share/fonts/truetype/noto/NotoSansMono-Regular.ttf",
        "/usr/share/fonts/truetype/ubuntu/UbuntuMono-R.ttf",
        "/usr/share/fonts/TTF/DejaVuSansMono.ttf",
        "/usr/share/fonts/TTF/liberation-mono.ttf",
        "/usr/share/fonts/dejavu-sans-mono-fonts/DejaVuSansMono.ttf",
        "/usr/local/share/fonts/DejaVuSansMono.ttf",
        "/System/Library/Fonts/Supplemental/Courier New.ttf",
        "/Library/Fonts/Courier New.ttf",
        "/System/Library/Fonts/Monaco.ttf",
        "C:\\Windows\\Fonts\\cour.ttf",
        "C:\\Windows\\Fonts\\consola.ttf",
        "C:\\Windows\\Fonts\\lucon.ttf",
    };
    candidates.insert(candidates.end(), std::begin(system_fonts), std::end(system_fonts));

    if (const char* xdg_data = std::getenv("XDG_DATA_HOME")) {
        candidates.push_back(std::string(xdg_data) + "/fonts/DejaVuSansMono.ttf");
    }

    for (const std::string& path : candidates) {
        if (file_exists(path)) return path;
    }
    return "";
}

FontLoader::FontLoader() : font_info_(std::make_unique<FontInfoImpl>()) {}
FontLoader::~FontLoader() = default;

Result FontLoader::load(const std::string& path, float pixel_size) {
    if (!is_safe_font_path(path)) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "Invalid or unsafe font path");
    }

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "Cannot open font file: " + path);
    }

    const std::streamoff length = file.tellg();
    if (length <= 0) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "Font file is empty: " + path);
    }
    if (static_cast<size_t>(length) > kMaxFontBytes) {
        return Result::fail(ErrorCode::FONT_ERROR, "Font file is too large: " + path);
    }

    std::vector<uint8_t> buffer(static_cast<size_t>(length));
    file.seekg(0);
    if (!file.read(reinterpret_cast<char*>(buffer.data()), length)) {
        return Result::fail(ErrorCode::IO_ERROR, "Failed to read font file: " + path);
    }

    Result result = load_from_memory(buffer.data(), buffer.size(), pixel_size);
    if (result.success()) {
        path_ = path;
    } else {
        result.message += ": " + path;
    }
    return result;
}

Result FontLoader::load_from_memory(const uint8_t* data, size_t size, float pixel_size) {
    if (!data || size < 12 || size > kMaxFontBytes || !has_sfnt_signature(data)) {
        return Result::fail(ErrorCode::FONT_ERROR, "Not a TrueType or OpenType font");
    }
    if (pixel_size <= 0.0f) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "Font size must be positive");
    }

    // stb_truetype keeps pointers into the buffer, so the loader owns a copy.
    if (data != font_data_.data()) {
        font_data_.assign(data, data + size);
    }

    if (!stbtt_InitFont(&font_info_->info, font_data_.data(),
                        stbtt_GetFontOffsetForIndex(font_data_.data(), 0))) {
        loaded_ = false;
        return Result::fail(ErrorCode::FONT_ERROR, "Failed to initialize font");
    }

    // Size is the em size in pixels, the convention of most text APIs.
    pixel_size_ = pixel_size;
    scale_ = stbtt_ScaleForMappingEmToPixels(&font_info_->info, pixel_size);

    int ascent, descent, line_gap;
    stbtt_GetFontVMetrics(&font_info_->info, &ascent, &descent, &line_gap);
    ascent_px_ = static_cast<int>(std::lround(ascent * scale_));

    loaded_ = true;
    return Result::ok();
}

bool FontLoader::has_glyph(uint32_t codepoint) const {
    if (!loaded_) return false;
    return stbtt_FindGlyphIndex(&font_info_->info, static_cast<int>(codepoint)) != 0;
}

GlyphMetrics FontLoader::measure(uint32_t codepoint) const {
    GlyphMetrics metrics;
    if (!loaded_) return metrics;

    int advance, lsb;
    stbtt_GetCodepointHMetrics(&font_info_->info, static_cast<int>(codepoint), &advance, &lsb);

    int x0, y0, x1, y1;
    stbtt_GetCodepointBitmapBox(&font_info_->info, static_cast<int>(codepoint),
                                scale_, scale_, &x0, &y0, &x1, &y1);

    metrics.width = static_cast<int>(std::lround(advance * scale_));
    // Descenders extend the box below the baseline.
    metrics.height = ascent_px_ + std::max(0, y1);
    return metrics;
}

GlyphBitmap FontLoader::rasterize(uint32_t codepoint, int stroke_width) const {
    GlyphBitmap bitmap;
    if (!loaded_) return bitmap;

    int x0, y0, x1, y1;
    stbtt_GetCodepointBitmapBox(&font_info_->info, static_cast<int>(codepoint),
                                scale_, scale_, &x0, &y0, &x1, &y1);

    int w = x1 - x0;
    int h = y1 - y0;
    bitmap.offset_x = x0;
    bitmap.offset_y = ascent_px_ + y0;
    if (w <= 0 || h <= 0) {
        return bitmap;
    }

    bitmap.width = w;
    bitmap.height = h;
    bitmap.pixels.resize(static_cast<size_t>(w) * h, 0);
    stbtt_MakeCodepointBitmap(&font_info_->info, bitmap.pixels.data(), w, h, w,
                              scale_, scale_, static_cast<int>(codepoint));

    if (stroke_width > 0) {
        return dilate(bitmap, stroke_width);
    }
    return bitmap;
}

Result FontLoader::load_system_fallback(float pixel_size) {
    std::string font_path = find_system_monospace_font();

    if (font_path.empty()) {
        return Result::fail(ErrorCode::FONT_ERROR, "No system monospace font found");
    }

    return load(font_path, pixel_size);
}

GlyphBitmap dilate(const GlyphBitmap& glyph, int radius) {
    if (radius <= 0 || glyph.empty()) return glyph;

    GlyphBitmap out;
    out.width = glyph.width + 2 * radius;
    out.height = glyph.height + 2 * radius;
    out.offset_x = glyph.offset_x - radius;
    out.offset_y = glyph.offset_y - radius;
    out.pixels.assign(static_cast<size_t>(out.width) * out.height, 0);

    const int r2 = radius * radius;
    for (int y = 0; y < out.height; ++y) {
        for (int x = 0; x < out.width; ++x) {
            uint8_t best = 0;
            for (int dy = -radius; dy <= radius && best < 255; ++dy) {
                int sy = y - radius + dy;
                if (sy < 0 || sy >= glyph.height) continue;
                for (int dx = -radius; dx <= radius; ++dx) {
                    if (dx * dx + dy * dy > r2) continue;
                    int sx = x - radius + dx;
                    if (sx < 0 || sx >= glyph.width) continue;
                    best = std::max(best, glyph.at(sx, sy));
                }
            }
            out.pixels[static_cast<size_t>(y) * out.width + x] = best;
        }
    }
    return out;
}

void draw_glyph(FrameBuffer& canvas, const GlyphBitmap& glyph, int x, int y, const Color& fill) {
    if (glyph.empty()) return;

    const int x_base = x + glyph.offset_x;
    const int y_base = y + glyph.offset_y;
    const int y_begin = std::max(0, -y_base);
    const int y_end = std::min(glyph.height, canvas.height() - y_base);
    const int x_begin = std::max(0, -x_base);
    const int x_end = std::min(glyph.width, canvas.width() - x_base);

    for (int gy = y_begin; gy < y_end; ++gy) {
        uint8_t* row = canvas.row(y_base + gy);
        for (int gx = x_begin; gx < x_end; ++gx) {
            const int alpha = glyph.at(gx, gy);
            if (alpha == 0) continue;
            uint8_t* px = row + static_cast<size_t>(x_base + gx) * FrameBuffer::kChannels;
            px[0] = static_cast<uint8_t>((fill.r * alpha + px[0] * (255 - alpha) + 127) / 255);
            px[1] = static_cast<uint8_t>((fill.g * alpha + px[1] * (255 - alpha) + 127) / 255);
            px[2] = static_cast<uint8_t>((fill.b * alpha + px[2] * (255 - alpha) + 127) / 255);
        }
    }
}

}
