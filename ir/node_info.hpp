#ifndef CSGIR_IR_NODE_INFO_HPP
#define CSGIR_IR_NODE_INFO_HPP

#include <span>
#include <string_view>

namespace csgir {
namespace ir {

enum class Dimensionality {
    TwoD,
    ThreeD,
    DimensionFree,
};

// Internal field name and the parameter name OpenSCAD knows it by.
struct FieldAlias {
    std::string_view field;
    std::string_view parameter;
};

// Per-type metadata that drives the generic transpilation rule.
struct NodeInfo {
    std::string_view keyword;
    Dimensionality dimensionality;
    std::string_view container;   // "child", "children" or empty for leaves
    std::span<const FieldAlias> aliases;

    bool is_container() const { return !container.empty(); }

    std::string_view parameter_name(std::string_view field) const {
        for (const auto& alias : aliases) {
            if (alias.field == field) {
                return alias.parameter;
            }
        }
        return field;
    }
};

const char* to_string(Dimensionality dimensionality);

}  // namespace ir
}  // namespace csgir

#endif // CSGIR_IR_NODE_INFO_HPP
