#ifndef KGVIZ_SERIALIZATION_JSON_SERIALIZATION_HPP
#define KGVIZ_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include "logging.hpp"
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace kgviz::json {

// Envelope format written by the CLI. Readers accept any file with the
// same major version.
constexpr const char* FORMAT_VERSION = "1.0";

// Path meaning stdin for reads and stdout for writes
constexpr const char* STDIO_PATH = "-";

// Result of one pipeline step plus the inputs that produced it
struct SerializedData {
    std::string version = FORMAT_VERSION;
    std::string step;            // "layout", ...
    std::string timestamp;
    std::string source_file;     // Graph payload the step consumed
    nlohmann::json config;       // VizConfig in effect
    nlohmann::json stats;
    nlohmann::json data;
};

// "1.0" -> "1"
inline std::string major_version(const std::string& version) {
    return version.substr(0, version.find('.'));
}

// ISO 8601, UTC
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Fresh envelope for a step, stamped with the current time
inline SerializedData make_envelope(const std::string& step, const std::string& source_file) {
    SerializedData envelope;
    envelope.step = step;
    envelope.source_file = source_file;
    envelope.timestamp = get_timestamp();
    return envelope;
}

inline void to_json(nlohmann::json& j, const SerializedData& envelope) {
    j = {
        {"version", envelope.version},
        {"step", envelope.step}
    };
    if (!envelope.timestamp.empty()) j["timestamp"] = envelope.timestamp;
    if (!envelope.source_file.empty()) j["source_file"] = envelope.source_file;
    if (!envelope.config.is_null()) j["config"] = envelope.config;
    if (!envelope.stats.is_null()) j["stats"] = envelope.stats;
    j["data"] = envelope.data;
}

// Throws if the data section is missing or the major version differs
inline void from_json(const nlohmann::json& j, SerializedData& envelope) {
    if (!j.is_object() || !j.contains("data")) {
        throw std::runtime_error("Serialized file has no 'data' section");
    }
    envelope.version = j.value("version", std::string(FORMAT_VERSION));
    if (major_version(envelope.version) != major_version(FORMAT_VERSION)) {
        throw std::runtime_error("Unsupported format version " + envelope.version +
                                 " (expected " + FORMAT_VERSION + ")");
    }
    envelope.step = j.value("step", std::string());
    envelope.timestamp = j.value("timestamp", std::string());
    envelope.source_file = j.value("source_file", std::string());
    envelope.config = j.contains("config") ? j["config"] : nlohmann::json();
    envelope.stats = j.contains("stats") ? j["stats"] : nlohmann::json();
    envelope.data = j["data"];
}

// Parse JSON text; `origin` names the source in error messages
inline nlohmann::json parse_json(std::istream& in, const std::string& origin) {
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + origin + ": " + e.what());
    }
}

// Read a JSON document from a file, or from stdin for "-"
inline nlohmann::json read_json_file(const std::string& path) {
    if (path == STDIO_PATH) {
        return parse_json(std::cin, "<stdin>");
    }
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    return parse_json(file, path);
}

// Write pretty-printed JSON to a file, or to stdout for "-"
inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    if (path == STDIO_PATH) {
        std::cout << j.dump(2) << "\n";
        return;
    }
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2) << "\n";
    kgviz::logging::get_logger()->debug("Wrote JSON to {}", path);
}

inline void write_serialized(const std::string& path, const SerializedData& envelope) {
    write_json_file(path, nlohmann::json(envelope));
}

inline SerializedData read_serialized(const std::string& path) {
    return read_json_file(path).get<SerializedData>();
}

}  // namespace kgviz::json

#endif // KGVIZ_SERIALIZATION_JSON_SERIALIZATION_HPP
