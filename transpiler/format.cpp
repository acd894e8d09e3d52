#include "format.hpp"
#include <common/errors.hpp>
#include <array>
#include <charconv>
#include <cmath>
#include <cctype>

namespace csgir {
namespace scad {

std::string format_integer(std::int64_t value) {
    return std::to_string(value);
}

std::string format_number(double value) {
    // Cut off redundant decimals; they tend to come from earlier arithmetic.
    if (std::isfinite(value) && value == std::trunc(value) && std::abs(value) < 9.2e18) {
        return format_integer(static_cast<std::int64_t>(value));
    }
    std::array<char, 32> buffer{};
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    return std::string(buffer.data(), end);
}

ShellWords split_shell_words(std::string_view text) {
    enum class State { Between, Word, Double, Single };

    ShellWords result;
    State state = State::Between;
    std::string word;

    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        switch (state) {
            case State::Double:
                if (c == '\\' && i + 1 < text.size() && (text[i + 1] == '"' || text[i + 1] == '\\')) {
                    word += text[++i];
                } else if (c == '"') {
                    state = State::Word;
                } else {
                    word += c;
                }
                break;
            case State::Single:
                if (c == '\'') {
                    state = State::Word;
                } else {
                    word += c;
                }
                break;
            case State::Between:
            case State::Word:
                if (std::isspace(static_cast<unsigned char>(c))) {
                    if (state == State::Word) {
                        result.words.push_back(word);
                        word.clear();
                    }
                    state = State::Between;
                } else if (c == '"') {
                    state = State::Double;
                } else if (c == '\'') {
                    state = State::Single;
                } else if (c == '\\') {
                    if (i + 1 >= text.size()) {
                        result.closed = false;
                        return result;
                    }
                    word += text[++i];
                    state = State::Word;
                } else {
                    word += c;
                    state = State::Word;
                }
                break;
        }
    }

    if (state == State::Double || state == State::Single) {
        result.closed = false;
        return result;
    }
    if (state == State::Word) {
        result.words.push_back(word);
    }
    return result;
}

std::string format_string(std::string_view value) {
    std::string candidate = "\"" + std::string(value) + "\"";
    ShellWords split = split_shell_words(candidate);

    if (!split.closed) {
        throw StringEncodingError("String “" + std::string(value) + "” has no closing quotation.");
    }
    if (split.words.size() != 1) {
        throw StringEncodingError("String “" + std::string(value) +
                                  "” would form multiple OpenSCAD strings.");
    }
    if (split.words.front() != value) {
        // Escape codes needed.
        throw StringEncodingError("String “" + std::string(value) +
                                  "” cannot be an OpenSCAD string without escape codes.");
    }
    return candidate;
}

std::string format_value(const ir::Value& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return format_integer(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return format_number(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return format_string(v);
        } else {
            std::string result = "[";
            for (std::size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += format_value(v[i]);
            }
            return result + "]";
        }
    }, value.data);
}

}  // namespace scad
}  // namespace csgir
