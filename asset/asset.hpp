#ifndef CSGIR_ASSET_ASSET_HPP
#define CSGIR_ASSET_ASSET_HPP

#include <ir/expression.hpp>
#include <array>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace csgir {

// Camera placed by translation, rotation and distance from the target.
struct Gimbal {
    ir::Vec3 translation;
    ir::Vec3 rotation;
    double distance;

    bool operator==(const Gimbal&) const = default;
};

// Camera placed by eye position, looking at a center point.
struct VectorCamera {
    ir::Vec3 eye;
    ir::Vec3 center = {0, 0, 0};

    bool operator==(const VectorCamera&) const = default;
};

using Camera = std::variant<Gimbal, VectorCamera>;

// A two-dimensional picture of an asset.
struct Image {
    std::filesystem::path path;  // relative to the render directory
    std::optional<Camera> camera;
    std::optional<std::array<int, 2>> size;
    std::string colorscheme;

    bool operator==(const Image&) const = default;
};

// Yields the top-level expressions of an asset. Must be idempotent.
using ContentThunk = std::function<ir::Children()>;

// A named, independently serializable deliverable.
struct Asset {
    ContentThunk content;
    std::string name = "untitled";
    std::vector<Asset> modules;
    std::vector<std::string> suffixes = {".stl"};
    std::vector<Image> images;
    bool chiral = false;
    bool mirrored = false;

    Asset();
    Asset(ContentThunk thunk);
    Asset(const ir::Expression& expression);
    Asset(ir::Children expressions);

    Asset with_content(ContentThunk thunk) const;
    Asset with_content(ir::Children expressions) const;
    Asset with_name(std::string new_name) const;
    Asset with_modules(std::vector<Asset> new_modules) const;
    Asset with_mirrored(bool value) const;
};

// Wrap a fixed sequence of expressions as a thunk.
ContentThunk constant_content(ir::Children expressions);

// Name an anonymous asset after the batch it was written in and its place
// in that batch.
std::string untitled_name(int batch, int ordinal);

Asset package_asset(ContentThunk thunk, int batch, int ordinal);

}  // namespace csgir

#endif // CSGIR_ASSET_ASSET_HPP
