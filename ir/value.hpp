#ifndef CSGIR_IR_VALUE_HPP
#define CSGIR_IR_VALUE_HPP

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace csgir {
namespace ir {

using Vec2 = std::array<double, 2>;
using Vec3 = std::array<double, 3>;
using Vec4 = std::array<double, 4>;

struct Value;
using ValueList = std::vector<Value>;

// A literal as it appears in a parameter list: a scalar, a string, or a
// (possibly nested) list of those.
struct Value {
    std::variant<bool, std::int64_t, double, std::string, ValueList> data;

    Value(bool b) : data(b) {}
    Value(int i) : data(static_cast<std::int64_t>(i)) {}
    Value(std::int64_t i) : data(i) {}
    Value(double d) : data(d) {}
    Value(const char* s) : data(std::string(s)) {}
    Value(std::string s) : data(std::move(s)) {}
    Value(const std::filesystem::path& p) : data(p.string()) {}
    Value(ValueList list) : data(std::move(list)) {}

    template <typename T, std::size_t N>
    Value(const std::array<T, N>& items) : data(ValueList(items.begin(), items.end())) {}

    template <typename T>
    Value(const std::vector<T>& items) : data(ValueList(items.begin(), items.end())) {}

    bool is_bool() const { return std::holds_alternative<bool>(data); }
    bool is_integer() const { return std::holds_alternative<std::int64_t>(data); }
    bool is_real() const { return std::holds_alternative<double>(data); }
    bool is_number() const { return is_integer() || is_real(); }
    bool is_string() const { return std::holds_alternative<std::string>(data); }
    bool is_list() const { return std::holds_alternative<ValueList>(data); }

    // Integers and reals both read back as double.
    double as_number() const;
    const std::string& as_string() const { return std::get<std::string>(data); }
    const ValueList& as_list() const { return std::get<ValueList>(data); }

    bool operator==(const Value& other) const = default;
};

// Name of the value's kind, for error messages.
std::string type_name(const Value& value);

// True for a list whose every member is a number.
bool is_numeric_list(const Value& value);

// Loose rendering for diagnostics, not for output.
std::string display(const Value& value);

}  // namespace ir
}  // namespace csgir

#endif // CSGIR_IR_VALUE_HPP
