#include "assembly.hpp"
#include <vocab/vocabulary.hpp>
#include <set>
#include <type_traits>

namespace csgir {

namespace {

const ir::MirrorAxes x_axis = {1, 0, 0};

using NameSet = std::set<std::string>;

ir::Expression mirror_x(const ir::Expression& expression) {
    return vocab::mirror(x_axis, {expression});
}

// Names of the modules a flip mirrors, at any depth.
void collect_flipped(const Asset& module, NameSet& names) {
    for (const auto& nested : module.modules) {
        collect_flipped(nested, names);
    }
    if (module.chiral && !module.mirrored) {
        names.insert(module.name);
    }
}

bool calls_any(const ir::Expression& expression, const NameSet& names) {
    return std::visit([&names](const auto& node) -> bool {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, ir::ModuleCall2D> || std::is_same_v<T, ir::ModuleCall3D> ||
                      std::is_same_v<T, ir::ModuleCallND>) {
            if (names.contains(node.name)) {
                return true;
            }
        }
        if constexpr (std::is_same_v<T, ir::Commented2D> || std::is_same_v<T, ir::Commented3D>) {
            return calls_any(*node.subject, names);
        }
        bool found = false;
        ir::for_each_child(node, [&](const ir::Expression& child) {
            found = found || calls_any(child, names);
        });
        return found;
    }, expression.node);
}

const std::string* defined_name(const ir::Expression& expression) {
    if (auto* definition = std::get_if<ir::ModuleDefinition2D>(&expression.node)) {
        return &definition->name;
    }
    if (auto* definition = std::get_if<ir::ModuleDefinition3D>(&expression.node)) {
        return &definition->name;
    }
    return nullptr;
}

// Extend a set of flipped module names with every module whose definition
// calls one of them, directly or through other modules.
void close_over_calls(const ir::Children& definitions, NameSet& names) {
    bool grown = true;
    while (grown) {
        grown = false;
        for (const auto& expression : definitions) {
            const std::string* name = defined_name(expression);
            if (name && !names.contains(*name) && calls_any(expression, names)) {
                names.insert(*name);
                grown = true;
            }
        }
    }
}

// Mirror the parent's own geometry. Metadata, module definitions and
// statements that already reach a flipped module body are kept as they are.
ir::Children mirror_geometry(const ir::Children& content, const NameSet& flipped) {
    ir::Children mirrored;
    mirrored.reserve(content.size());
    for (const auto& expression : content) {
        const bool metadata = ir::dimensionality(expression) == ir::Dimensionality::DimensionFree &&
                              !expression.holds<ir::ModuleCallND>();
        if (metadata || defined_name(expression) || calls_any(expression, flipped)) {
            mirrored.push_back(expression);
        } else {
            mirrored.push_back(mirror_x(expression));
        }
    }
    return mirrored;
}

ir::Children definitions_of(const Asset& asset, bool flip) {
    ir::Children definitions;
    for (const auto& module : asset.modules) {
        ir::Children inner = modularize(module, flip);
        definitions.insert(definitions.end(), inner.begin(), inner.end());
    }
    return definitions;
}

// The mirror-x image of an asset: chiral modules flip their own bodies and
// the rest of the geometry is mirrored around them.
Asset mirror_image(const Asset& asset) {
    ir::Children content = definitions_of(asset, true);

    NameSet flipped;
    for (const auto& module : asset.modules) {
        collect_flipped(module, flipped);
    }
    close_over_calls(content, flipped);

    ir::Children own = mirror_geometry(asset.content(), flipped);
    content.insert(content.end(), own.begin(), own.end());
    return asset.with_content(std::move(content)).with_modules({});
}

}  // namespace

ir::Children modularize(const Asset& module, bool flip) {
    ir::Children definitions = definitions_of(module, flip);

    ir::Children body = module.content();
    if (body.size() > 1) {
        body = {vocab::union_(std::move(body))};
    }
    if (flip && module.chiral && !module.mirrored && !body.empty()) {
        body = {mirror_x(body.front())};
    }
    definitions.push_back(vocab::define_module(module.name, std::move(body)));
    return definitions;
}

Asset flatten(const Asset& asset, bool flip) {
    ir::Children content = definitions_of(asset, flip);
    ir::Children own = asset.content();
    content.insert(content.end(), own.begin(), own.end());

    return asset.with_content(std::move(content)).with_modules({});
}

std::vector<Asset> refine(const Asset& asset, const AssemblyOptions& options) {
    std::vector<Asset> refined;

    const bool duplicate = asset.chiral && !asset.mirrored && options.flip_chiral;
    const RenameRule& rename = asset.chiral ? options.rename_chiral : options.rename_achiral;

    // With a mirrored duplicate to carry the flipped modules, the primary
    // keeps them as authored.
    const bool flip_primary = options.flip_chiral && !duplicate;
    refined.push_back(flatten(asset, flip_primary).with_name(rename(asset.name)));

    if (duplicate) {
        refined.push_back(mirror_image(asset).with_name(options.rename_mirrored(asset.name)).with_mirrored(true));
    }

    return refined;
}

}  // namespace csgir
