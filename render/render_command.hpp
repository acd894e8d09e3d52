#ifndef CSGIR_RENDER_RENDER_COMMAND_HPP
#define CSGIR_RENDER_RENDER_COMMAND_HPP

#include <asset/asset.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace csgir {

// One invocation of the external renderer.
struct RenderJob {
    std::string asset;
    std::filesystem::path input;
    std::filesystem::path output;
    std::vector<std::string> command;

    bool operator==(const RenderJob&) const = default;
};

// Camera as the renderer's --camera argument. Gimbal rotations are held in
// radians and passed on in degrees.
std::string format_camera(const Camera& camera);

// renderer [-o output] [--camera ...] [--imgsize w,h] [--colorscheme s] input
std::vector<std::string> compose_renderer_command(const std::string& renderer,
                                                  const std::filesystem::path& input,
                                                  const std::optional<std::filesystem::path>& output,
                                                  const Image* image = nullptr);

// One job per output suffix and one per image of a refined asset.
std::vector<RenderJob> plan_render_jobs(const Asset& asset,
                                        const std::filesystem::path& scad_dir,
                                        const std::filesystem::path& render_dir,
                                        const std::string& renderer = "openscad");

}  // namespace csgir

#endif // CSGIR_RENDER_RENDER_COMMAND_HPP
