#include "flat_tune/core/events.hpp"
#include "flat_tune/core/utils.hpp"

namespace flat_tune::core {

json EventEmitter::base_event(const std::string& type) {
    return {
        {"type", type},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    if (!out_) return;
    *out_ << event.dump() << "\n";
    out_->flush();
}

void EventEmitter::catalog_scanned(const fs::path& root, ImageFormat format,
                                   int tiles, int files) {
    json event = base_event("catalog_scanned");
    event["root"] = root.string();
    event["format"] = image_format_to_string(format);
    event["tiles"] = tiles;
    event["files"] = files;
    emit(event);
}

void EventEmitter::plane_loaded(int plane_index, int tiles_loaded, int tiles_missing) {
    json event = base_event("plane_loaded");
    event["plane"] = plane_index;
    event["tiles_loaded"] = tiles_loaded;
    event["tiles_missing"] = tiles_missing;
    emit(event);
}

void EventEmitter::composite_built(int rows, int cols, int tiles, double seconds) {
    json event = base_event("composite_built");
    event["rows"] = rows;
    event["cols"] = cols;
    event["tiles"] = tiles;
    event["seconds"] = seconds;
    emit(event);
}

void EventEmitter::flat_written(const fs::path& path, const std::string& grid_name) {
    json event = base_event("flat_written");
    event["path"] = path.string();
    event["grid"] = grid_name;
    emit(event);
}

void EventEmitter::script_written(const fs::path& path, int commands) {
    json event = base_event("script_written");
    event["path"] = path.string();
    event["commands"] = commands;
    emit(event);
}

void EventEmitter::warning(const std::string& message) {
    json event = base_event("warning");
    event["message"] = message;
    emit(event);
}

void EventEmitter::error(const std::string& kind, const std::string& subject,
                         const std::string& message) {
    json event = base_event("error");
    event["kind"] = kind;
    event["subject"] = subject;
    event["message"] = message;
    emit(event);
}

void emit_event(const std::string& type, const json& data, std::ostream& out) {
    json event = {
        {"type", type},
        {"ts", get_iso_timestamp()}
    };
    for (auto& [key, value] : data.items()) {
        event[key] = value;
    }
    out << event.dump() << "\n";
    out.flush();
}

} // namespace flat_tune::core
