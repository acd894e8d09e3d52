#include "expression.hpp"

namespace csgir {
namespace ir {

Child::Child(Expression expression)
    : expression_(std::make_shared<const Expression>(std::move(expression))) {}

bool Child::operator==(const Child& other) const {
    return expression_ == other.expression_ || *expression_ == *other.expression_;
}

const NodeInfo& info(const Expression& expression) {
    return std::visit([](const auto& node) -> const NodeInfo& {
        using T = std::decay_t<decltype(node)>;
        return T::info;
    }, expression.node);
}

Dimensionality dimensionality(const Expression& expression) {
    return info(expression).dimensionality;
}

const char* to_string(Dimensionality dimensionality) {
    switch (dimensionality) {
        case Dimensionality::TwoD: return "2D";
        case Dimensionality::ThreeD: return "3D";
        case Dimensionality::DimensionFree: return "ND";
    }
    return "ND";
}

}  // namespace ir
}  // namespace csgir
