#include "operators.hpp"
#include "vocabulary.hpp"
#include <common/errors.hpp>
#include <algorithm>
#include <limits>

namespace csgir {
namespace vocab {

namespace {

enum class Arith { Add, Sub, Mul };

const ir::Value* as_value(const Operand& operand) {
    return std::get_if<ir::Value>(&operand);
}

bool numeric(const std::vector<Operand>& args) {
    return std::all_of(args.begin(), args.end(), [](const Operand& a) {
        auto* v = as_value(a);
        return v && v->is_number();
    });
}

// Same-length, one-dimensional numeric vectors.
bool vectors(const std::vector<Operand>& args) {
    if (args.empty()) {
        return false;
    }
    std::size_t length = 0;
    for (std::size_t i = 0; i < args.size(); ++i) {
        auto* v = as_value(args[i]);
        if (!v || !ir::is_numeric_list(*v)) {
            return false;
        }
        if (i == 0) {
            length = v->as_list().size();
        } else if (v->as_list().size() != length) {
            return false;
        }
    }
    return true;
}

ir::Value apply(Arith op, const ir::Value& a, const ir::Value& b) {
    if (a.is_integer() && b.is_integer()) {
        auto x = std::get<std::int64_t>(a.data);
        auto y = std::get<std::int64_t>(b.data);
        std::int64_t r = 0;
        bool overflow = false;
        switch (op) {
            case Arith::Add: overflow = __builtin_add_overflow(x, y, &r); break;
            case Arith::Sub: overflow = __builtin_sub_overflow(x, y, &r); break;
            case Arith::Mul: overflow = __builtin_mul_overflow(x, y, &r); break;
        }
        // Out of integer range: carry on in floating point.
        if (!overflow) {
            return r;
        }
    }
    double x = a.as_number();
    double y = b.as_number();
    switch (op) {
        case Arith::Add: return x + y;
        case Arith::Sub: return x - y;
        case Arith::Mul: return x * y;
    }
    return x;
}

ir::Value negate(const ir::Value& v) {
    if (v.is_integer()) {
        auto x = std::get<std::int64_t>(v.data);
        if (x != std::numeric_limits<std::int64_t>::min()) {
            return -x;
        }
    }
    return -v.as_number();
}

ir::Value fold(Arith op, const std::vector<Operand>& args) {
    ir::Value result = std::get<ir::Value>(args.front());
    for (std::size_t i = 1; i < args.size(); ++i) {
        result = apply(op, result, std::get<ir::Value>(args[i]));
    }
    return result;
}

// Apply a variadic operation position by position across vectors.
template <typename Fn>
ir::Value columns(const std::vector<Operand>& args, Fn&& fn) {
    std::size_t length = std::get<ir::Value>(args.front()).as_list().size();
    ir::ValueList result;
    for (std::size_t i = 0; i < length; ++i) {
        std::vector<Operand> column;
        for (const auto& a : args) {
            column.push_back(std::get<ir::Value>(a).as_list()[i]);
        }
        result.push_back(std::get<ir::Value>(fn(column)));
    }
    return result;
}

}  // namespace

Operand add(const std::vector<Operand>& args) {
    if (args.empty()) {
        return ir::Value(0);
    }
    if (vectors(args)) {
        if (args.size() == 1) {
            return args.front();
        }
        return columns(args, add);
    }
    if (!numeric(args)) {
        throw OperatorError("“+” is mathematical. Use “|” for unions.");
    }
    return fold(Arith::Add, args);
}

Operand sub(const std::vector<Operand>& args) {
    if (args.empty()) {
        throw OperatorError("“-” requires at least one operand.");
    }
    if (numeric(args)) {
        if (args.size() == 1) {
            return negate(std::get<ir::Value>(args.front()));
        }
        return fold(Arith::Sub, args);
    }
    if (vectors(args)) {
        if (args.size() == 1) {
            ir::ValueList negated;
            for (const auto& v : std::get<ir::Value>(args.front()).as_list()) {
                negated.push_back(negate(v));
            }
            return ir::Value(std::move(negated));
        }
        return columns(args, sub);
    }
    // Not all numeric. Fall back to geometry.
    return difference(expect_expressions({"contain", "subtract from", "subtract"}, args));
}

Operand mul(const std::vector<Operand>& args) {
    if (args.empty()) {
        return ir::Value(1);
    }
    if (numeric(args)) {
        return fold(Arith::Mul, args);
    }
    if (args.size() != 1) {
        throw OperatorError("Non-numeric “*” requires exactly one operand.");
    }
    return modify(Modifier::Disable, expect_expressions({"disable"}, args));
}

Operand div(const std::vector<Operand>& args) {
    if (args.empty()) {
        throw OperatorError("“/” requires at least one operand.");
    }
    if (!numeric(args)) {
        throw OperatorError("“/” is mathematical. Numbers only.");
    }
    double result = std::get<ir::Value>(args.front()).as_number();
    if (args.size() == 1) {
        if (result == 0) {
            throw OperatorError("Division by zero.");
        }
        return ir::Value(1 / result);
    }
    for (std::size_t i = 1; i < args.size(); ++i) {
        double divisor = std::get<ir::Value>(args[i]).as_number();
        if (divisor == 0) {
            throw OperatorError("Division by zero.");
        }
        result /= divisor;
    }
    return ir::Value(result);
}

ir::Expression operator-(const ir::Expression& minuend, const ir::Expression& subtrahend) {
    return difference({minuend, subtrahend});
}

ir::Expression operator|(const ir::Expression& a, const ir::Expression& b) {
    return union_({a, b});
}

}  // namespace vocab
}  // namespace csgir
