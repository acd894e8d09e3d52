#include "render_command.hpp"
#include <asset/writer.hpp>
#include <math/angle.hpp>
#include <transpiler/format.hpp>

namespace csgir {

namespace {

void append_numbers(std::string& out, const ir::Vec3& values) {
    for (double v : values) {
        if (!out.empty()) out += ",";
        out += scad::format_number(v);
    }
}

}  // namespace

std::string format_camera(const Camera& camera) {
    std::string out;
    std::visit([&out](const auto& c) {
        using T = std::decay_t<decltype(c)>;
        if constexpr (std::is_same_v<T, Gimbal>) {
            ir::Vec3 degrees;
            for (std::size_t i = 0; i < degrees.size(); ++i) {
                degrees[i] = snap_degrees(radians_to_degrees(c.rotation[i]));
            }
            append_numbers(out, c.translation);
            append_numbers(out, degrees);
            out += "," + scad::format_number(c.distance);
        } else {
            append_numbers(out, c.eye);
            append_numbers(out, c.center);
        }
    }, camera);
    return out;
}

std::vector<std::string> compose_renderer_command(const std::string& renderer,
                                                  const std::filesystem::path& input,
                                                  const std::optional<std::filesystem::path>& output,
                                                  const Image* image) {
    std::vector<std::string> command = {renderer};
    if (output) {
        command.push_back("-o");
        command.push_back(output->string());
    }
    if (image) {
        if (image->camera) {
            command.push_back("--camera");
            command.push_back(format_camera(*image->camera));
        }
        if (image->size) {
            command.push_back("--imgsize");
            command.push_back(std::to_string((*image->size)[0]) + "," + std::to_string((*image->size)[1]));
        }
        if (!image->colorscheme.empty()) {
            command.push_back("--colorscheme");
            command.push_back(image->colorscheme);
        }
    }
    command.push_back(input.string());
    return command;
}

std::vector<RenderJob> plan_render_jobs(const Asset& asset,
                                        const std::filesystem::path& scad_dir,
                                        const std::filesystem::path& render_dir,
                                        const std::string& renderer) {
    std::vector<RenderJob> jobs;
    std::filesystem::path input = compose_scad_output_path(scad_dir, asset);

    for (const auto& suffix : asset.suffixes) {
        std::filesystem::path output = render_dir / (asset.name + suffix);
        jobs.push_back({asset.name, input, output,
                        compose_renderer_command(renderer, input, output)});
    }
    for (const auto& image : asset.images) {
        std::filesystem::path output = render_dir / image.path;
        jobs.push_back({asset.name, input, output,
                        compose_renderer_command(renderer, input, output, &image)});
    }
    return jobs;
}

}  // namespace csgir
