#include "flat_tune/io/image_io.hpp"
#include "flat_tune/core/errors.hpp"
#include "flat_tune/core/utils.hpp"

#include <opencv2/opencv.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <vector>

namespace flat_tune::io {

namespace {

constexpr std::streamsize kRawHeaderBytes = 8;

uint32_t read_le_u32(const unsigned char* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

void write_le_u32(unsigned char* p, uint32_t v) {
    p[0] = static_cast<unsigned char>(v & 0xff);
    p[1] = static_cast<unsigned char>((v >> 8) & 0xff);
    p[2] = static_cast<unsigned char>((v >> 16) & 0xff);
    p[3] = static_cast<unsigned char>((v >> 24) & 0xff);
}

ImageShape read_raw_header(std::ifstream& file, const fs::path& path) {
    std::array<unsigned char, kRawHeaderBytes> header{};
    if (!file.read(reinterpret_cast<char*>(header.data()), kRawHeaderBytes)) {
        throw IOError("Truncated raw header: " + path.string(), path.string());
    }
    uint32_t width = read_le_u32(header.data());
    uint32_t height = read_le_u32(header.data() + 4);
    if (width == 0 || height == 0) {
        throw IOError("Raw image has zero extent: " + path.string(), path.string());
    }
    return {static_cast<int>(height), static_cast<int>(width)};
}

cv::Mat read_tiff_mat(const fs::path& path) {
    cv::Mat img = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    if (img.empty()) {
        throw IOError("Cannot read TIFF image: " + path.string(), path.string());
    }
    if (img.channels() != 1) {
        throw IOError("Expected a single-channel image, got " +
                      std::to_string(img.channels()) + " channels: " + path.string(),
                      path.string());
    }
    return img;
}

} // namespace

bool is_tiff_path(const fs::path& path) {
    std::string ext = core::to_lower(path.extension().string());
    return ext == ".tif" || ext == ".tiff";
}

bool is_raw_path(const fs::path& path) {
    return core::to_lower(path.extension().string()) == ".raw";
}

std::optional<ImageFormat> detect_image_format(const fs::path& path) {
    if (is_tiff_path(path)) return ImageFormat::TIFF;
    if (is_raw_path(path)) return ImageFormat::RAW;
    return std::nullopt;
}

Matrix2Df read_image_float(const fs::path& path) {
    auto format = detect_image_format(path);
    if (!format) {
        throw IOError("Unsupported image format: " + path.string(), path.string());
    }
    if (*format == ImageFormat::RAW) {
        return read_raw_float(path);
    }

    cv::Mat img = read_tiff_mat(path);
    cv::Mat img_f;
    img.convertTo(img_f, CV_32F);
    if (!img_f.isContinuous()) {
        img_f = img_f.clone();
    }

    Matrix2Df data(img_f.rows, img_f.cols);
    std::memcpy(data.data(), img_f.ptr<float>(0),
                static_cast<size_t>(data.size()) * sizeof(float));
    return data;
}

Matrix2Df read_raw_float(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Cannot open raw image: " + path.string(), path.string());
    }

    ImageShape shape = read_raw_header(file, path);
    const size_t npixels = static_cast<size_t>(shape.rows) * static_cast<size_t>(shape.cols);

    std::vector<unsigned char> buffer(npixels * 2);
    if (!file.read(reinterpret_cast<char*>(buffer.data()),
                   static_cast<std::streamsize>(buffer.size()))) {
        throw IOError("Truncated raw pixel data: " + path.string(), path.string());
    }

    Matrix2Df data(shape.rows, shape.cols);
    float* out = data.data();
    for (size_t i = 0; i < npixels; ++i) {
        uint16_t v = static_cast<uint16_t>(buffer[2 * i] | (buffer[2 * i + 1] << 8));
        out[i] = static_cast<float>(v);
    }
    return data;
}

void write_raw_u16(const fs::path& path, const Matrix2Df& data) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Cannot create raw image: " + path.string(), path.string());
    }

    std::array<unsigned char, kRawHeaderBytes> header{};
    write_le_u32(header.data(), static_cast<uint32_t>(data.cols()));
    write_le_u32(header.data() + 4, static_cast<uint32_t>(data.rows()));
    file.write(reinterpret_cast<const char*>(header.data()), kRawHeaderBytes);

    std::vector<unsigned char> buffer(static_cast<size_t>(data.size()) * 2);
    const float* in = data.data();
    for (Eigen::Index i = 0; i < data.size(); ++i) {
        float clamped = std::min(std::max(std::round(in[i]), 0.0f), 65535.0f);
        uint16_t v = static_cast<uint16_t>(clamped);
        buffer[2 * i] = static_cast<unsigned char>(v & 0xff);
        buffer[2 * i + 1] = static_cast<unsigned char>((v >> 8) & 0xff);
    }
    file.write(reinterpret_cast<const char*>(buffer.data()),
               static_cast<std::streamsize>(buffer.size()));
    if (!file) {
        throw IOError("Cannot write raw image: " + path.string(), path.string());
    }
}

ImageShape probe_dimensions(const fs::path& path) {
    auto format = detect_image_format(path);
    if (!format) {
        throw IOError("Unsupported image format: " + path.string(), path.string());
    }

    if (*format == ImageFormat::RAW) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw IOError("Cannot open raw image: " + path.string(), path.string());
        }
        return read_raw_header(file, path);
    }

    // OpenCV has no header-only query; callers cache the result.
    cv::Mat img = read_tiff_mat(path);
    return {img.rows, img.cols};
}

void write_tiff_float(const fs::path& path, const Matrix2Df& data, bool compress) {
    cv::Mat img(static_cast<int>(data.rows()), static_cast<int>(data.cols()), CV_32F,
                const_cast<float*>(data.data()));

    std::vector<int> params;
    if (compress) {
        // libtiff COMPRESSION_ADOBE_DEFLATE
        params = {cv::IMWRITE_TIFF_COMPRESSION, 8};
    }

    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), img, params);
    } catch (const cv::Exception& e) {
        throw IOError("Cannot write TIFF image " + path.string() + ": " + e.what(),
                      path.string());
    }
    if (!ok) {
        throw IOError("Cannot write TIFF image: " + path.string(), path.string());
    }
}

void write_image_u8(const fs::path& path, const std::vector<uint8_t>& pixels, int rows,
                    int cols) {
    if (pixels.size() != static_cast<size_t>(rows) * static_cast<size_t>(cols)) {
        throw IOError("Pixel buffer does not match " + std::to_string(rows) + "x" +
                      std::to_string(cols) + ": " + path.string(), path.string());
    }
    cv::Mat img(rows, cols, CV_8U, const_cast<uint8_t*>(pixels.data()));

    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), img);
    } catch (const cv::Exception& e) {
        throw IOError("Cannot write image " + path.string() + ": " + e.what(), path.string());
    }
    if (!ok) {
        throw IOError("Cannot write image: " + path.string(), path.string());
    }
}

} // namespace flat_tune::io
