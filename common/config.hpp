#ifndef CSGIR_COMMON_CONFIG_HPP
#define CSGIR_COMMON_CONFIG_HPP

#include <filesystem>
#include <string>

namespace csgir {

// Settings for a driver run.
struct Config {
    std::string output_dir = "output";
    std::string scad_subdir = "scad";
    std::string render_subdir = "render";
    std::string renderer = "openscad";
    bool flip_chiral = true;
    std::string mirrored_suffix = "_mirrored";
    bool render = false;

    std::filesystem::path scad_dir() const {
        return std::filesystem::path(output_dir) / scad_subdir;
    }

    std::filesystem::path render_dir() const {
        return std::filesystem::path(output_dir) / render_subdir;
    }

    bool operator==(const Config&) const = default;
};

}  // namespace csgir

#endif // CSGIR_COMMON_CONFIG_HPP
