#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace flat_tune::core {

using json = nlohmann::json;

// Writes one JSON object per line. A null stream disables emission.
class EventEmitter {
public:
    explicit EventEmitter(std::ostream* out = nullptr) : out_(out) {}

    void catalog_scanned(const fs::path& root, ImageFormat format, int tiles, int files);
    void plane_loaded(int plane_index, int tiles_loaded, int tiles_missing);
    void composite_built(int rows, int cols, int tiles, double seconds);
    void flat_written(const fs::path& path, const std::string& grid_name);
    void script_written(const fs::path& path, int commands);

    void warning(const std::string& message);
    void error(const std::string& kind, const std::string& subject, const std::string& message);

private:
    void emit(const json& event);
    json base_event(const std::string& type);

    std::ostream* out_;
};

void emit_event(const std::string& type, const json& data, std::ostream& out);

} // namespace flat_tune::core
