#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace flat_tune {

namespace fs = std::filesystem;

// Matrix types (row-major, matching the on-disk pixel order)
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXf = Eigen::VectorXf;

// Image container formats, in scan preference order
enum class ImageFormat {
    TIFF,
    RAW
};

inline std::string image_format_to_string(ImageFormat format) {
    switch (format) {
        case ImageFormat::TIFF: return "TIFF";
        case ImageFormat::RAW: return "RAW";
        default: return "UNKNOWN";
    }
}

// Physical (micron) position of one stack in the acquisition grid.
struct GridKey {
    double x_um = 0.0;
    double y_um = 0.0;

    bool operator<(const GridKey& other) const {
        if (x_um != other.x_um) return x_um < other.x_um;
        return y_um < other.y_um;
    }
    bool operator==(const GridKey& other) const {
        return x_um == other.x_um && y_um == other.y_um;
    }
    bool operator!=(const GridKey& other) const { return !(*this == other); }
};

// Directory-style name of a key: tenths of a micron, "X_Y".
inline std::string grid_key_name(const GridKey& key) {
    return std::to_string(std::lround(key.x_um * 10.0)) + "_" +
           std::to_string(std::lround(key.y_um * 10.0));
}

// Voxel size in microns, (z, y, x) order.
struct VoxelSize {
    double z = 2.0;
    double y = 1.8;
    double x = 1.8;
};

struct ImageShape {
    int rows = 0;
    int cols = 0;

    bool operator==(const ImageShape& other) const {
        return rows == other.rows && cols == other.cols;
    }
    bool operator!=(const ImageShape& other) const { return !(*this == other); }
};

inline std::string shape_to_string(const ImageShape& s) {
    return std::to_string(s.rows) + "x" + std::to_string(s.cols);
}

// Pixel placement of a tile's top-left corner inside the composite.
struct Placement {
    int row = 0;
    int col = 0;
};

// Operator-controlled parameters of one grid position.
struct TileState {
    std::optional<std::string> flat_key;   // key into the flat-field library
    int offset = 0;                        // signed vertical pixel shift
    std::optional<Matrix2Df> pixels;       // current Z-plane, if present
};

using TileStateMap = std::map<GridKey, TileState>;

} // namespace flat_tune
