#ifndef CSGIR_SERIALIZATION_CONFIG_JSON_HPP
#define CSGIR_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <common/config.hpp>
#include <common/errors.hpp>
#include <fstream>
#include <string>

namespace csgir {

inline void to_json(nlohmann::json& j, const Config& config) {
    j = {
        {"output_dir", config.output_dir},
        {"scad_subdir", config.scad_subdir},
        {"render_subdir", config.render_subdir},
        {"renderer", config.renderer},
        {"flip_chiral", config.flip_chiral},
        {"mirrored_suffix", config.mirrored_suffix},
        {"render", config.render}
    };
}

inline void from_json(const nlohmann::json& j, Config& config) {
    if (!j.is_object()) {
        throw ConfigError("Configuration must be a JSON object, not " + std::string(j.type_name()) + ".");
    }
    const Config defaults;
    try {
        config.output_dir = j.value("output_dir", defaults.output_dir);
        config.scad_subdir = j.value("scad_subdir", defaults.scad_subdir);
        config.render_subdir = j.value("render_subdir", defaults.render_subdir);
        config.renderer = j.value("renderer", defaults.renderer);
        config.flip_chiral = j.value("flip_chiral", defaults.flip_chiral);
        config.mirrored_suffix = j.value("mirrored_suffix", defaults.mirrored_suffix);
        config.render = j.value("render", defaults.render);
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigError(std::string("Malformed configuration: ") + e.what());
    }
}

// Read a configuration file. Keys left out keep their defaults.
inline Config load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Cannot parse configuration " + path + ": " + e.what());
    }
    return j.get<Config>();
}

}  // namespace csgir

#endif // CSGIR_SERIALIZATION_CONFIG_JSON_HPP
