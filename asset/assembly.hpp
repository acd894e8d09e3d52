#ifndef CSGIR_ASSET_ASSEMBLY_HPP
#define CSGIR_ASSET_ASSEMBLY_HPP

#include "asset.hpp"
#include <functional>
#include <string>
#include <vector>

namespace csgir {

using RenameRule = std::function<std::string(const std::string&)>;

struct AssemblyOptions {
    bool flip_chiral = true;
    RenameRule rename_mirrored = [](const std::string& name) { return name + "_mirrored"; };
    RenameRule rename_chiral = [](const std::string& name) { return name; };
    RenameRule rename_achiral = [](const std::string& name) { return name; };
};

// Turn a module into the module definitions it needs: those of its own
// modules, depth first, then its own. A body of several expressions is
// unioned. With flip set, a chiral module that is not already mirrored gets
// its body mirrored across the x axis.
ir::Children modularize(const Asset& module, bool flip);

// Flatten an asset's modules into its content: every module definition,
// then the asset's own expressions. The result has no modules.
Asset flatten(const Asset& asset, bool flip);

// Produce the self-contained assets to write for one asset. A chiral asset
// that is not yet mirrored also yields its mirror-x image when flipping is
// enabled: chiral modules flip their own bodies there, and the asset's own
// geometry is mirrored except where it calls a flipped module. Without such a
// duplicate, chiral modules are flipped in the single output.
std::vector<Asset> refine(const Asset& asset, const AssemblyOptions& options = {});

}  // namespace csgir

#endif // CSGIR_ASSET_ASSEMBLY_HPP
