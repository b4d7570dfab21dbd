#ifndef WASHIWRAP_SERIALIZATION_JSON_SERIALIZATION_HPP
#define WASHIWRAP_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace washiwrap::json {

// Version of the envelope format. Files with another major version are rejected.
constexpr const char* SERIALIZATION_VERSION = "1.0.0";

inline std::string major_version(const std::string& version) {
    return version.substr(0, version.find('.'));
}

// Envelope written by every CLI step: what produced the payload, from which
// mesh, with which settings
struct SerializedData {
    std::string version = SERIALIZATION_VERSION;
    std::string step;
    std::string timestamp;
    std::string source_file;
    nlohmann::json config;
    nlohmann::json stats;
    nlohmann::json data;

    nlohmann::json to_json() const {
        nlohmann::json j = {{"version", version}, {"step", step}};
        if (!timestamp.empty()) j["timestamp"] = timestamp;
        if (!source_file.empty()) j["source_file"] = source_file;
        if (!config.is_null()) j["config"] = config;
        if (!stats.is_null()) j["stats"] = stats;
        j["data"] = data;
        return j;
    }

    static SerializedData from_json(const nlohmann::json& j) {
        if (!j.is_object() || !j.contains("data")) {
            throw std::runtime_error("Serialized data has no 'data' member");
        }
        SerializedData result;
        result.version = j.value("version", "unknown");
        if (major_version(result.version) != major_version(SERIALIZATION_VERSION)) {
            throw std::runtime_error("Unsupported serialization version " + result.version +
                                     " (expected " + SERIALIZATION_VERSION + ")");
        }
        result.step = j.value("step", "unknown");
        result.timestamp = j.value("timestamp", "");
        result.source_file = j.value("source_file", "");
        result.config = j.value("config", nlohmann::json());
        result.stats = j.value("stats", nlohmann::json());
        result.data = j["data"];
        return result;
    }

    // Throws when the payload came from a different step
    void require_step(const std::string& expected) const {
        if (step != expected) {
            throw std::runtime_error("Expected '" + expected + "' data, got '" + step + "'");
        }
    }
};

// UTC, ISO 8601
inline std::string get_timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

inline SerializedData make_envelope(const std::string& step, const std::string& source_file,
                                    nlohmann::json config, nlohmann::json stats, nlohmann::json data) {
    SerializedData out;
    out.step = step;
    out.timestamp = get_timestamp();
    out.source_file = source_file;
    out.config = std::move(config);
    out.stats = std::move(stats);
    out.data = std::move(data);
    return out;
}

inline bool is_json_path(const std::string& path) {
    return path.size() >= 5 && path.compare(path.size() - 5, 5, ".json") == 0;
}

inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2);
    if (!file) {
        throw std::runtime_error("Failed writing JSON: " + path);
    }
}

// Parse errors are reported with the path
inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
}

inline void write_serialized(const std::string& path, const SerializedData& data) {
    write_json_file(path, data.to_json());
}

inline SerializedData read_serialized(const std::string& path) {
    return SerializedData::from_json(read_json_file(path));
}

}  // namespace washiwrap::json

#endif // WASHIWRAP_SERIALIZATION_JSON_SERIALIZATION_HPP
