#ifndef CSGIR_TRANSPILER_FORMAT_HPP
#define CSGIR_TRANSPILER_FORMAT_HPP

#include <ir/value.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace csgir {
namespace scad {

std::string format_integer(std::int64_t value);

// Whole numbers lose their decimals; anything else is the shortest text that
// reads back as the same double.
std::string format_number(double value);

// Double-quote a string. Throws StringEncodingError if the quoted result would
// not read back, shell-style, as exactly one word equal to the input.
std::string format_string(std::string_view value);

// Any literal on one line. Lists become bracketed, comma-separated lists.
std::string format_value(const ir::Value& value);

struct ShellWords {
    std::vector<std::string> words;
    bool closed = true;  // false if a quotation was left open
};

// POSIX-shell-like word splitting without comments.
ShellWords split_shell_words(std::string_view text);

}  // namespace scad
}  // namespace csgir

#endif // CSGIR_TRANSPILER_FORMAT_HPP
