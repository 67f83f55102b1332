#include "flat_tune/image/preview.hpp"
#include "flat_tune/core/utils.hpp"

#include <algorithm>
#include <cmath>

namespace flat_tune::image {

PreviewImage render_preview(const Matrix2Df& composite, float percentile) {
    PreviewImage out;
    out.rows = static_cast<int>(composite.rows());
    out.cols = static_cast<int>(composite.cols());
    out.pixels.assign(static_cast<size_t>(composite.size()), 0);
    if (composite.size() == 0) {
        return out;
    }

    out.high = core::compute_percentile(composite, percentile);
    if (!(out.high > 0.0f)) {
        return out;
    }

    const float scale = 255.0f / out.high;
    const float* in = composite.data();
    for (Eigen::Index i = 0; i < composite.size(); ++i) {
        float v = std::min(std::max(in[i], 0.0f), out.high) * scale;
        out.pixels[static_cast<size_t>(i)] = static_cast<uint8_t>(std::lround(v));
    }
    return out;
}

} // namespace flat_tune::image
