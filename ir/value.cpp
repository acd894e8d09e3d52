#include "value.hpp"

#include <algorithm>
#include <sstream>

namespace csgir {
namespace ir {

double Value::as_number() const {
    if (auto* i = std::get_if<std::int64_t>(&data)) {
        return static_cast<double>(*i);
    }
    return std::get<double>(data);
}

std::string type_name(const Value& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) return "boolean";
        else if constexpr (std::is_same_v<T, std::int64_t>) return "integer";
        else if constexpr (std::is_same_v<T, double>) return "real";
        else if constexpr (std::is_same_v<T, std::string>) return "string";
        else return "list";
    }, value.data);
}

bool is_numeric_list(const Value& value) {
    if (!value.is_list()) {
        return false;
    }
    const auto& list = value.as_list();
    return std::all_of(list.begin(), list.end(),
                       [](const Value& v) { return v.is_number(); });
}

std::string display(const Value& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, ValueList>) {
            std::ostringstream oss;
            oss << "[";
            for (std::size_t i = 0; i < v.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << display(v[i]);
            }
            oss << "]";
            return oss.str();
        } else {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        }
    }, value.data);
}

}  // namespace ir
}  // namespace csgir
