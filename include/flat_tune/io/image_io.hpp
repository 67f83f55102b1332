#pragma once

#include "flat_tune/core/types.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace flat_tune::io {

bool is_tiff_path(const fs::path& path);

bool is_raw_path(const fs::path& path);

std::optional<ImageFormat> detect_image_format(const fs::path& path);

// Reads a single-plane TIFF or .raw image as float, dispatching on extension.
Matrix2Df read_image_float(const fs::path& path);

// .raw layout: uint32 width, uint32 height, then width*height uint16 pixels,
// all little-endian.
Matrix2Df read_raw_float(const fs::path& path);

void write_raw_u16(const fs::path& path, const Matrix2Df& data);

// Rows and columns without decoding pixels where the format allows it.
ImageShape probe_dimensions(const fs::path& path);

void write_tiff_float(const fs::path& path, const Matrix2Df& data, bool compress = true);

// 8-bit grayscale in any format OpenCV picks from the extension.
void write_image_u8(const fs::path& path, const std::vector<uint8_t>& pixels, int rows,
                    int cols);

} // namespace flat_tune::io
