#include "writer.hpp"
#include <common/logging.hpp>
#include <fstream>
#include <stdexcept>

namespace csgir {

std::filesystem::path compose_scad_output_path(const std::filesystem::path& directory,
                                               const Asset& asset) {
    return directory / (asset.name + ".scad");
}

void write_scad(std::ostream& out, const ir::Children& content, const scad::Transpiler& transpiler) {
    for (const auto& expression : content) {
        transpiler.transpile(expression, [&out](const std::string& line) {
            out << line << '\n';
        });
        out << '\n';
    }
}

Writer::Writer(std::filesystem::path scad_dir, AssemblyOptions options)
    : scad_dir_(std::move(scad_dir)), options_(std::move(options)) {}

std::vector<Asset> Writer::write(const std::vector<Asset>& assets) {
    auto log = logging::get_logger();
    ++next_batch_;

    std::vector<Asset> written;
    for (const auto& asset : assets) {
        log->debug("Refining asset {} ({} modules)", asset.name, asset.modules.size());
        std::vector<Asset> refined = refine(asset, options_);
        for (const auto& output : refined) {
            write_file(output);
            written.push_back(output);
        }
    }
    log->info("Wrote {} .scad files to {}", written.size(), scad_dir_.string());
    return written;
}

std::vector<Asset> Writer::write(const std::vector<ir::Children>& contents) {
    std::vector<Asset> assets;
    int ordinal = 0;
    for (const auto& content : contents) {
        assets.push_back(package_asset(constant_content(content), next_batch_, ordinal++));
    }
    return write(assets);
}

void Writer::write_file(const Asset& asset) const {
    auto log = logging::get_logger();
    std::filesystem::path path = compose_scad_output_path(scad_dir_, asset);
    if (!path.parent_path().empty()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path.string());
    }
    write_scad(file, asset.content(), transpiler_);
    log->debug("Wrote {}", path.string());
}

}  // namespace csgir
