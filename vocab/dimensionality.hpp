#ifndef CSGIR_VOCAB_DIMENSIONALITY_HPP
#define CSGIR_VOCAB_DIMENSIONALITY_HPP

#include <ir/expression.hpp>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace csgir {
namespace vocab {

// Anything a caller may hand to a dynamically-typed entry point.
using Operand = std::variant<ir::Expression, ir::Value>;

// Verbs used in error messages. The first operand may be described
// differently from the rest ("subtract from" vs "subtract").
struct Verbs {
    std::string_view base;
    std::string_view first = {};
    std::string_view rest = {};
};

// Common dimensionality of the expressions: 2D or 3D.
// Dimension-free expressions are ignored; with none of known dimensionality
// the result is 3D. Mixed input throws DimensionalityMismatchError.
ir::Dimensionality classify(std::string_view verb, std::span<const ir::Expression> expressions);

// Check that the dimensionality implied by the length of an argument (2 or 3)
// matches that of the expressions, and return it. Expressions of unknown
// dimensionality classify as 3D, so they only match a 3D argument.
ir::Dimensionality match_against_argument(std::string_view verb,
                                          const std::vector<double>& argument,
                                          std::span<const ir::Expression> expressions);

// True if any expression is 2D or 3D.
bool has_dimensioned(std::span<const ir::Expression> expressions);

// Throw DimensionalityMismatchError if any expression has the given dimensionality.
void reject_dimensionality(std::string_view verb, ir::Dimensionality rejected,
                           std::span<const ir::Expression> expressions);

// Unwrap operands that must all be expressions, or throw ExpressionTypeError.
std::vector<ir::Expression> expect_expressions(const Verbs& verbs, const std::vector<Operand>& operands);

// Describe a bad value for the benefit of the user.
std::string quote_value(const ir::Value& value);

}  // namespace vocab
}  // namespace csgir

#endif // CSGIR_VOCAB_DIMENSIONALITY_HPP
