#pragma once

#include "core/types.hpp"
#include <array>
#include <vector>
#include <cstdint>

namespace asciimedia {

// Atlas index per sampled cell, row-major.
struct IndexMap {
    int cols = 0;
    int rows = 0;
    std::vector<int> indices;

    int at(int col, int row) const { return indices[static_cast<size_t>(row) * cols + col]; }
    bool operator==(const IndexMap& other) const {
        return cols == other.cols && rows == other.rows && indices == other.indices;
    }
};

// Maps RGB to an atlas index with integer arithmetic only:
//   luma  = (77 R + 150 G + 29 B) >> 8        in [0, 255]
//   index = (luma * N) >> 8                   in [0, N)
// The weights approximate 0.299/0.587/0.114 and sum to 256, so both shifts
// are fixed at 8 for 8-bit input.
class LuminanceIndexer {
public:
    static constexpr int kWeightR = 77;
    static constexpr int kWeightG = 150;
    static constexpr int kWeightB = 29;
    static constexpr int kWeightShift = 8;
    static constexpr int kIndexShift = 8;

    static_assert(kWeightR + kWeightG + kWeightB == (1 << kWeightShift),
                  "luminance weights must sum to one in fixed point");

    explicit LuminanceIndexer(size_t atlas_size);

    static uint8_t luminance(uint8_t r, uint8_t g, uint8_t b) {
        return static_cast<uint8_t>((kWeightR * r + kWeightG * g + kWeightB * b) >> kWeightShift);
    }

    int index(uint8_t r, uint8_t g, uint8_t b) const { return lut_[luminance(r, g, b)]; }
    int index(const Color& c) const { return index(c.r, c.g, c.b); }
    int index(const uint8_t* rgb) const { return index(rgb[0], rgb[1], rgb[2]); }

    // Samples one pixel per step_x by step_y block, starting at the block's
    // top-left corner. Partial blocks at the right and bottom edges count.
    IndexMap index_grid(const FrameBuffer& frame, int step_x, int step_y) const;

    size_t atlas_size() const { return atlas_size_; }

private:
    size_t atlas_size_ = 0;
    std::array<int, 256> lut_{};
};

}
