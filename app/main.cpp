#include <exception>
#include <iostream>
#include <numbers>
#include <optional>
#include <string>
#include <vector>

#include <asset/writer.hpp>
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <render/render_command.hpp>
#include <serialization/asset_json.hpp>
#include <serialization/config_json.hpp>
#include <serialization/json_serialization.hpp>
#include <vocab/utilities.hpp>
#include <vocab/vocabulary.hpp>

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [options]\n";
    std::cerr << "\n";
    std::cerr << "Writes the demonstration assets as OpenSCAD files.\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -c, --config <file>    JSON configuration\n";
    std::cerr << "  -v, --verbose          Log at debug level\n";
    std::cerr << "  --manifest <file>      Write written assets and render jobs as JSON\n";
    std::cerr << "  -h, --help             Show this help message\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  CSGIR_LOG_LEVEL - Set log level (trace, debug, info, warn, error)\n";
}

struct Options {
    std::optional<std::string> config_path;
    std::optional<std::string> manifest_path;
    bool verbose = false;
    bool help = false;
};

Options parse_args(int argc, char** argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                throw std::runtime_error("-c/--config requires an argument");
            }
            options.config_path = argv[++i];
        } else if (arg == "--manifest") {
            if (i + 1 >= argc) {
                throw std::runtime_error("--manifest requires an argument");
            }
            options.manifest_path = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }
    return options;
}

std::vector<csgir::Asset> demonstration_assets() {
    using namespace csgir::vocab;

    csgir::Asset arm(hull({sphere(2), translate({20, 5, 0}, {sphere(2)})}));
    arm.name = "arm";
    arm.chiral = true;

    csgir::Asset bracket({
        special("$fn", 32, 128),
        union_({cube({30, 10, 4}), call_module("arm")}),
    });
    bracket.name = "bracket";
    bracket.chiral = true;
    bracket.modules = {arm};
    bracket.images = {csgir::Image{"bracket.png",
                                   csgir::Gimbal{{0, 0, 0}, {std::numbers::pi / 3, 0, std::numbers::pi / 6}, 120},
                                   std::array<int, 2>{800, 600}, "Tomorrow"}};

    csgir::Asset plate(difference({
        linear_extrude(3, {round_corners(3, {square({40, 40})})}),
        translate({0, 0, -1}, {cylinder(4, 5, false)}),
    }));
    plate.name = "plate";
    plate.suffixes = {".stl", ".3mf"};

    return {bracket, plate};
}

}  // namespace

int main(int argc, char* argv[]) {
    auto log = csgir::logging::get_logger();

    try {
        Options options = parse_args(argc, argv);
        if (options.help) {
            print_usage(argv[0]);
            return 0;
        }
        if (options.verbose) {
            log->set_level(spdlog::level::debug);
        }

        csgir::Config config;
        if (options.config_path) {
            log->info("Loading configuration from {}", *options.config_path);
            config = csgir::load_config(*options.config_path);
        }

        csgir::AssemblyOptions assembly;
        assembly.flip_chiral = config.flip_chiral;
        assembly.rename_mirrored = [suffix = config.mirrored_suffix](const std::string& name) {
            return name + suffix;
        };

        csgir::Writer writer(config.scad_dir(), assembly);
        std::vector<csgir::Asset> written;
        int failures = 0;

        // A failing asset does not stop the others.
        for (const auto& asset : demonstration_assets()) {
            try {
                std::vector<csgir::Asset> out = writer.write(std::vector<csgir::Asset>{asset});
                written.insert(written.end(), out.begin(), out.end());
            } catch (const std::exception& e) {
                log->error("Asset {} failed: {}", asset.name, e.what());
                ++failures;
            }
        }

        if (options.manifest_path) {
            csgir::json::Manifest manifest;
            manifest.timestamp = csgir::json::get_timestamp();
            manifest.config = config;
            for (const auto& asset : written) {
                manifest.assets.push_back(nlohmann::json(asset));
                if (config.render) {
                    for (const auto& job : csgir::plan_render_jobs(asset, config.scad_dir(),
                                                                   config.render_dir(), config.renderer)) {
                        log->debug("Planned render of {} to {}", job.asset, job.output.string());
                        manifest.jobs.push_back(nlohmann::json(job));
                    }
                }
            }
            csgir::json::write_manifest(*options.manifest_path, manifest);
            log->info("Wrote manifest {} ({} assets, {} render jobs)", *options.manifest_path,
                      manifest.assets.size(), manifest.jobs.size());
        }

        log->info("Done: {} assets written, {} failed", written.size(), failures);
        return failures == 0 ? 0 : 1;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
