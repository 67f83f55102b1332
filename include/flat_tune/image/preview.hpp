#pragma once

#include "flat_tune/core/types.hpp"

#include <cstdint>
#include <vector>

namespace flat_tune::image {

struct PreviewImage {
    std::vector<uint8_t> pixels;  // row-major, rows * cols
    int rows = 0;
    int cols = 0;
    float high = 0.0f;            // value mapped to 255
};

// Clips to [0, percentile(composite)] and scales to 8 bit for display.
PreviewImage render_preview(const Matrix2Df& composite, float percentile);

} // namespace flat_tune::image
