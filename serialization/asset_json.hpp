#ifndef CSGIR_SERIALIZATION_ASSET_JSON_HPP
#define CSGIR_SERIALIZATION_ASSET_JSON_HPP

#include <nlohmann/json.hpp>
#include <asset/asset.hpp>
#include <render/render_command.hpp>

namespace csgir {

// Gimbal serialization
inline void to_json(nlohmann::json& j, const Gimbal& gimbal) {
    j = {
        {"type", "gimbal"},
        {"translation", gimbal.translation},
        {"rotation", gimbal.rotation},
        {"distance", gimbal.distance}
    };
}

inline void from_json(const nlohmann::json& j, Gimbal& gimbal) {
    gimbal.translation = j.value("translation", ir::Vec3{0, 0, 0});
    gimbal.rotation = j.value("rotation", ir::Vec3{0, 0, 0});
    gimbal.distance = j.value("distance", 100.0);
}

// VectorCamera serialization
inline void to_json(nlohmann::json& j, const VectorCamera& camera) {
    j = {
        {"type", "vector"},
        {"eye", camera.eye},
        {"center", camera.center}
    };
}

inline void from_json(const nlohmann::json& j, VectorCamera& camera) {
    camera.eye = j.at("eye").get<ir::Vec3>();
    camera.center = j.value("center", ir::Vec3{0, 0, 0});
}

// Image serialization
inline void to_json(nlohmann::json& j, const Image& image) {
    j = {
        {"path", image.path.string()},
        {"colorscheme", image.colorscheme}
    };
    if (image.camera) {
        std::visit([&j](const auto& camera) { j["camera"] = camera; }, *image.camera);
    }
    if (image.size) {
        j["size"] = *image.size;
    }
}

inline void from_json(const nlohmann::json& j, Image& image) {
    image.path = j.at("path").get<std::string>();
    image.colorscheme = j.value("colorscheme", "");
    if (j.contains("camera")) {
        const auto& camera = j["camera"];
        if (camera.value("type", "gimbal") == "vector") {
            image.camera = camera.get<VectorCamera>();
        } else {
            image.camera = camera.get<Gimbal>();
        }
    }
    if (j.contains("size")) {
        image.size = j["size"].get<std::array<int, 2>>();
    }
}

// A refined asset is described by everything but its content.
inline void to_json(nlohmann::json& j, const Asset& asset) {
    j = {
        {"name", asset.name},
        {"suffixes", asset.suffixes},
        {"images", asset.images},
        {"chiral", asset.chiral},
        {"mirrored", asset.mirrored}
    };
}

// RenderJob serialization
inline void to_json(nlohmann::json& j, const RenderJob& job) {
    j = {
        {"asset", job.asset},
        {"input", job.input.string()},
        {"output", job.output.string()},
        {"command", job.command}
    };
}

inline void from_json(const nlohmann::json& j, RenderJob& job) {
    job.asset = j.value("asset", "");
    job.input = j.at("input").get<std::string>();
    job.output = j.at("output").get<std::string>();
    job.command = j.value("command", std::vector<std::string>{});
}

}  // namespace csgir

#endif // CSGIR_SERIALIZATION_ASSET_JSON_HPP
