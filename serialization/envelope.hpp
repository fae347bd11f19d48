#ifndef TRAITGALAXY_SERIALIZATION_ENVELOPE_HPP
#define TRAITGALAXY_SERIALIZATION_ENVELOPE_HPP

#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <initializer_list>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace traitgalaxy::json {

// Format version written by this build; files with any other version are
// rejected on read
constexpr const char* kFormatVersion = "0.1.0";

// What a file carries in its "data" section.
// Nodes and Layout hold a node list, Snapshot holds {"snapshot", "nodes"}.
enum class FileKind {
    Unknown,
    Nodes,
    Layout,
    Snapshot
};

NLOHMANN_JSON_SERIALIZE_ENUM(FileKind, {
    {FileKind::Unknown, nullptr},
    {FileKind::Nodes, "nodes"},
    {FileKind::Layout, "layout"},
    {FileKind::Snapshot, "snapshot"},
})

inline const char* to_string(FileKind kind) {
    switch (kind) {
        case FileKind::Unknown: return "unknown";
        case FileKind::Nodes: return "nodes";
        case FileKind::Layout: return "layout";
        case FileKind::Snapshot: return "snapshot";
    }
    return "unknown";
}

// Wrapper around every file the CLI reads or writes
struct Envelope {
    FileKind kind = FileKind::Unknown;
    std::string version = kFormatVersion;
    std::string timestamp;
    std::string source_file;
    nlohmann::json config;     // AppConfig the data was produced with
    nlohmann::json stats;      // Command-specific summary
    nlohmann::json data;
};

inline void to_json(nlohmann::json& j, const Envelope& envelope) {
    j = nlohmann::json::object();
    j["version"] = envelope.version;
    j["step"] = envelope.kind;
    if (!envelope.timestamp.empty()) j["timestamp"] = envelope.timestamp;
    if (!envelope.source_file.empty()) j["source_file"] = envelope.source_file;
    if (!envelope.config.is_null()) j["config"] = envelope.config;
    if (!envelope.stats.is_null()) j["stats"] = envelope.stats;
    j["data"] = envelope.data;
}

// Lenient read; use parse_envelope() to also validate version and kind
inline void from_json(const nlohmann::json& j, Envelope& envelope) {
    envelope.version = j.value("version", std::string());
    envelope.kind = j.value("step", FileKind::Unknown);
    envelope.timestamp = j.value("timestamp", std::string());
    envelope.source_file = j.value("source_file", std::string());
    envelope.config = j.value("config", nlohmann::json());
    envelope.stats = j.value("stats", nlohmann::json());
    envelope.data = j.at("data");
}

// Current UTC time in ISO 8601 format
inline std::string utc_timestamp() {
    auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// New envelope of the given kind, stamped with the current time
inline Envelope make_envelope(FileKind kind, nlohmann::json data,
                              const std::string& source_file = {}) {
    Envelope envelope;
    envelope.kind = kind;
    envelope.timestamp = utc_timestamp();
    envelope.source_file = source_file;
    envelope.data = std::move(data);
    return envelope;
}

// Throws std::runtime_error for a foreign version or a kind not in accepted
inline void check_envelope(const Envelope& envelope, std::initializer_list<FileKind> accepted) {
    if (envelope.version != kFormatVersion) {
        throw std::runtime_error("Unsupported file version '" + envelope.version +
                                 "' (expected " + kFormatVersion + ")");
    }
    if (std::find(accepted.begin(), accepted.end(), envelope.kind) == accepted.end()) {
        std::string expected;
        for (FileKind kind : accepted) {
            expected += expected.empty() ? "" : " or ";
            expected += to_string(kind);
        }
        throw std::runtime_error(std::string("Expected a ") + expected + " file, got " +
                                 to_string(envelope.kind));
    }
}

inline Envelope parse_envelope(const nlohmann::json& j, std::initializer_list<FileKind> accepted) {
    if (!j.is_object() || !j.contains("data")) {
        throw std::runtime_error("Not a traitgalaxy file: no 'data' section");
    }
    Envelope envelope = j.get<Envelope>();
    check_envelope(envelope, accepted);
    return envelope;
}

inline void write_envelope(const std::string& path, const Envelope& envelope) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << nlohmann::json(envelope).dump(2);
}

inline Envelope read_envelope(const std::string& path, std::initializer_list<FileKind> accepted) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    nlohmann::json j;
    file >> j;
    return parse_envelope(j, accepted);
}

// Plain JSON file without an envelope (configuration files)
inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    nlohmann::json j;
    file >> j;
    return j;
}

}  // namespace traitgalaxy::json

#endif // TRAITGALAXY_SERIALIZATION_ENVELOPE_HPP
