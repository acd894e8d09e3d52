#include "dimensionality.hpp"
#include <common/errors.hpp>
#include <sstream>

namespace csgir {
namespace vocab {

namespace {

std::string format_argument(const std::vector<double>& argument) {
    ir::Value value(argument);
    return ir::display(value);
}

}  // namespace

ir::Dimensionality classify(std::string_view verb, std::span<const ir::Expression> expressions) {
    std::vector<std::size_t> two;
    std::vector<std::size_t> three;

    for (std::size_t i = 0; i < expressions.size(); ++i) {
        switch (ir::dimensionality(expressions[i])) {
            case ir::Dimensionality::TwoD:
                two.push_back(i);
                break;
            case ir::Dimensionality::ThreeD:
                three.push_back(i);
                break;
            case ir::Dimensionality::DimensionFree:
                break;
        }
    }

    if (!two.empty() && !three.empty()) {
        // The renderer's treatment of mixed input is poorly defined.
        std::ostringstream oss;
        oss << "Cannot " << verb << " mixed 2D and 3D expressions.";
        if (two.size() == 1 && three.size() != 1) {
            oss << " One, in place " << two[0] + 1 << " of " << expressions.size() << ", is 2D.";
        } else if (two.size() != 1 && three.size() == 1) {
            oss << " One, in place " << three[0] + 1 << " of " << expressions.size() << ", is 3D.";
        }
        throw DimensionalityMismatchError(oss.str());
    }

    if (!two.empty()) {
        return ir::Dimensionality::TwoD;
    }

    // Expressions of unknown dimensionality are treated as 3D.
    return ir::Dimensionality::ThreeD;
}

ir::Dimensionality match_against_argument(std::string_view verb,
                                          const std::vector<double>& argument,
                                          std::span<const ir::Expression> expressions) {
    const std::size_t n0 = argument.size();
    const char* suffix = expressions.size() == 1 ? "" : "s";

    ir::Dimensionality implied;
    const char* other;
    if (n0 == 2) {
        implied = ir::Dimensionality::TwoD;
        other = "3D";
    } else if (n0 == 3) {
        implied = ir::Dimensionality::ThreeD;
        other = "2D";
    } else {
        std::ostringstream oss;
        oss << "Cannot " << verb << " OpenSCAD expression" << suffix
            << " with " << n0 << "D argument " << format_argument(argument) << ".";
        throw DimensionalityZeroError(oss.str());
    }

    if (classify(verb, expressions) == implied) {
        return implied;
    }

    std::ostringstream oss;
    oss << "Cannot " << verb << " " << other << " OpenSCAD expression" << suffix
        << " with " << n0 << "D argument " << format_argument(argument) << ".";
    throw DimensionalityMismatchError(oss.str());
}

bool has_dimensioned(std::span<const ir::Expression> expressions) {
    for (const auto& e : expressions) {
        if (ir::dimensionality(e) != ir::Dimensionality::DimensionFree) {
            return true;
        }
    }
    return false;
}

void reject_dimensionality(std::string_view verb, ir::Dimensionality rejected,
                           std::span<const ir::Expression> expressions) {
    for (std::size_t i = 0; i < expressions.size(); ++i) {
        if (ir::dimensionality(expressions[i]) == rejected) {
            std::ostringstream oss;
            oss << "Cannot " << verb << " " << ir::to_string(rejected)
                << " OpenSCAD expressions. One, in place " << i + 1
                << " of " << expressions.size() << ", is " << ir::to_string(rejected) << ".";
            throw DimensionalityMismatchError(oss.str());
        }
    }
}

std::vector<ir::Expression> expect_expressions(const Verbs& verbs, const std::vector<Operand>& operands) {
    std::vector<ir::Expression> result;
    result.reserve(operands.size());

    for (std::size_t i = 0; i < operands.size(); ++i) {
        if (auto* expression = std::get_if<ir::Expression>(&operands[i])) {
            result.push_back(*expression);
            continue;
        }
        std::string_view verb = verbs.base;
        if (i == 0 && !verbs.first.empty()) {
            verb = verbs.first;
        } else if (i > 0 && !verbs.rest.empty()) {
            verb = verbs.rest;
        }
        const auto& value = std::get<ir::Value>(operands[i]);
        std::ostringstream oss;
        oss << "Cannot " << verb << " non-OpenSCAD expression " << quote_value(value) << ".";
        throw ExpressionTypeError(oss.str());
    }

    return result;
}

std::string quote_value(const ir::Value& value) {
    std::string type = "of type " + ir::type_name(value);
    std::string text = ir::display(value);

    if (text.size() > 30) {
        return "“" + text.substr(0, 20) + "...” (truncated) " + type;
    }
    return "“" + text + "” " + type;
}

}  // namespace vocab
}  // namespace csgir
