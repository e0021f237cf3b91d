#include "luminance_indexer.hpp"

#include <algorithm>
#include <stdexcept>

#ifdef ASCIIMEDIA_HAS_OPENMP
#include <omp.h>
#endif

namespace asciimedia {

LuminanceIndexer::LuminanceIndexer(size_t atlas_size) : atlas_size_(atlas_size) {
    if (atlas_size == 0) {
        throw std::invalid_argument("LuminanceIndexer: atlas must not be empty");
    }
    const long long n = static_cast<long long>(atlas_size);
    for (int luma = 0; luma < 256; ++luma) {
        long long idx = (luma * n) >> kIndexShift;
        lut_[luma] = static_cast<int>(std::clamp<long long>(idx, 0, n - 1));
    }
}

IndexMap LuminanceIndexer::index_grid(const FrameBuffer& frame, int step_x, int step_y) const {
    IndexMap map;
    if (frame.empty() || step_x <= 0 || step_y <= 0) return map;

    map.cols = (frame.width() + step_x - 1) / step_x;
    map.rows = (frame.height() + step_y - 1) / step_y;
    map.indices.resize(static_cast<size_t>(map.cols) * map.rows);

    const int cols = map.cols;
    const int rows = map.rows;
    int* dst = map.indices.data();

#ifdef ASCIIMEDIA_HAS_OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (int r = 0; r < rows; ++r) {
        const uint8_t* src = frame.row(r * step_y);
        int* out = dst + static_cast<size_t>(r) * cols;
        for (int c = 0; c < cols; ++c) {
            out[c] = index(src + static_cast<size_t>(c) * step_x * FrameBuffer::kChannels);
        }
    }

    return map;
}

}
