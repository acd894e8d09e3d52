#ifndef CSGIR_VOCAB_OPERATORS_HPP
#define CSGIR_VOCAB_OPERATORS_HPP

#include "dimensionality.hpp"
#include <vector>

namespace csgir {
namespace vocab {

// Variadic arithmetic in the manner of Clojure, over numbers, same-length
// numeric vectors and, where it makes sense, expressions.

// Sum. 0 with no operands. Expressions are rejected.
Operand add(const std::vector<Operand>& args);

// Negate, subtract, or take the difference of expressions.
Operand sub(const std::vector<Operand>& args);

// Product. 1 with no operands. A single expression is disabled.
Operand mul(const std::vector<Operand>& args);

// Reciprocal or quotient. Numbers only.
Operand div(const std::vector<Operand>& args);

ir::Expression operator-(const ir::Expression& minuend, const ir::Expression& subtrahend);
ir::Expression operator|(const ir::Expression& a, const ir::Expression& b);

}  // namespace vocab
}  // namespace csgir

#endif // CSGIR_VOCAB_OPERATORS_HPP
