#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace flat_tune {

enum class ErrorKind {
    GENERIC,
    CONFIG,
    VALIDATION,
    IO,
    INVALID_GRID_COORDINATE,
    MISSING_FLAT_SELECTION,
    SHAPE_MISMATCH,
    HETEROGENEOUS_TILES,
    NON_POSITIVE_FLAT
};

inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::GENERIC: return "GENERIC";
        case ErrorKind::CONFIG: return "CONFIG";
        case ErrorKind::VALIDATION: return "VALIDATION";
        case ErrorKind::IO: return "IO";
        case ErrorKind::INVALID_GRID_COORDINATE: return "INVALID_GRID_COORDINATE";
        case ErrorKind::MISSING_FLAT_SELECTION: return "MISSING_FLAT_SELECTION";
        case ErrorKind::SHAPE_MISMATCH: return "SHAPE_MISMATCH";
        case ErrorKind::HETEROGENEOUS_TILES: return "HETEROGENEOUS_TILES";
        case ErrorKind::NON_POSITIVE_FLAT: return "NON_POSITIVE_FLAT";
        default: return "UNKNOWN";
    }
}

// Base of every error the library raises. `subject` names the offending
// grid key or path when there is one.
class FlatTuneError : public std::runtime_error {
public:
    explicit FlatTuneError(const std::string& message,
                           ErrorKind kind = ErrorKind::GENERIC,
                           std::string subject = std::string())
        : std::runtime_error(message), kind_(kind), subject_(std::move(subject)) {}

    ErrorKind kind() const { return kind_; }
    const std::string& subject() const { return subject_; }

private:
    ErrorKind kind_;
    std::string subject_;
};

class ConfigError : public FlatTuneError {
public:
    explicit ConfigError(const std::string& message)
        : FlatTuneError("Config error: " + message, ErrorKind::CONFIG) {}
};

class ValidationError : public FlatTuneError {
public:
    explicit ValidationError(const std::string& message,
                             const std::string& subject = std::string())
        : FlatTuneError("Validation error: " + message, ErrorKind::VALIDATION, subject) {}
};

class IOError : public FlatTuneError {
public:
    explicit IOError(const std::string& message,
                     const std::string& subject = std::string())
        : FlatTuneError("I/O error: " + message, ErrorKind::IO, subject) {}
};

class InvalidGridCoordinateError : public FlatTuneError {
public:
    explicit InvalidGridCoordinateError(const std::string& path)
        : FlatTuneError("Invalid grid coordinate directory (expected <int>_<int>): " + path,
                        ErrorKind::INVALID_GRID_COORDINATE, path) {}
};

class MissingFlatSelectionError : public FlatTuneError {
public:
    MissingFlatSelectionError(const std::string& grid_key, const std::string& detail)
        : FlatTuneError("No usable flat-field reference for tile " + grid_key + ": " + detail,
                        ErrorKind::MISSING_FLAT_SELECTION, grid_key) {}
};

// Divisor length differs from the tile row count. Always a defect.
class ShapeMismatchError : public FlatTuneError {
public:
    explicit ShapeMismatchError(const std::string& message)
        : FlatTuneError("Shape mismatch: " + message, ErrorKind::SHAPE_MISMATCH) {}
};

class HeterogeneousTilesError : public FlatTuneError {
public:
    HeterogeneousTilesError(const std::string& message, std::vector<std::string> keys)
        : FlatTuneError("Heterogeneous tile shapes: " + message,
                        ErrorKind::HETEROGENEOUS_TILES, join_keys(keys)),
          keys_(std::move(keys)) {}

    const std::vector<std::string>& offending_keys() const { return keys_; }

private:
    static std::string join_keys(const std::vector<std::string>& keys) {
        std::string out;
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) out += ",";
            out += keys[i];
        }
        return out;
    }

    std::vector<std::string> keys_;
};

class NonPositiveFlatError : public FlatTuneError {
public:
    NonPositiveFlatError(const std::string& path, const std::string& detail)
        : FlatTuneError("Flat-field reference is not strictly positive (" + detail + "): " + path,
                        ErrorKind::NON_POSITIVE_FLAT, path) {}
};

} // namespace flat_tune
