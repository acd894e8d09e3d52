#ifndef CSGIR_SERIALIZATION_JSON_SERIALIZATION_HPP
#define CSGIR_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace csgir::json {

// Version of the manifest format
constexpr const char* MANIFEST_VERSION = "0.1.0";

// What a driver run wrote and what it would hand to the renderer.
struct Manifest {
    std::string version = MANIFEST_VERSION;
    std::string timestamp;
    nlohmann::json config;
    nlohmann::json assets = nlohmann::json::array();
    nlohmann::json jobs = nlohmann::json::array();

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["version"] = version;
        if (!timestamp.empty()) j["timestamp"] = timestamp;
        if (!config.is_null()) j["config"] = config;
        j["assets"] = assets;
        j["jobs"] = jobs;
        return j;
    }

    static Manifest from_json(const nlohmann::json& j) {
        Manifest result;
        result.version = j.value("version", "unknown");
        result.timestamp = j.value("timestamp", "");
        if (j.contains("config")) result.config = j["config"];
        if (j.contains("assets")) result.assets = j["assets"];
        if (j.contains("jobs")) result.jobs = j["jobs"];
        return result;
    }
};

// Get current timestamp in ISO 8601 format
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2);
}

inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    nlohmann::json j;
    file >> j;
    return j;
}

inline void write_manifest(const std::string& path, const Manifest& manifest) {
    write_json_file(path, manifest.to_json());
}

inline Manifest read_manifest(const std::string& path) {
    return Manifest::from_json(read_json_file(path));
}

}  // namespace csgir::json

#endif // CSGIR_SERIALIZATION_JSON_SERIALIZATION_HPP
