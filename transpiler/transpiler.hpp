#ifndef CSGIR_TRANSPILER_TRANSPILER_HPP
#define CSGIR_TRANSPILER_TRANSPILER_HPP

#include <ir/expression.hpp>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace csgir {
namespace scad {

// Receives output lines in order, as soon as each one is complete.
using LineSink = std::function<void(const std::string&)>;

// Renders IR trees as OpenSCAD code. Stateless: the same tree always yields
// the same lines, and one instance may be shared between threads.
class Transpiler {
public:
    // Stream the lines for one expression, parent before children.
    void transpile(const ir::Expression& expression, const LineSink& sink) const;

    std::vector<std::string> transpile(const ir::Expression& expression) const;

    static constexpr std::string_view indentation = "    ";

private:
    template <typename Node>
    void from_metadata(const Node& node, const LineSink& sink) const;

    void contain(const std::string& lead, const ir::Children& body, const LineSink& sink) const;

    template <typename Node>
    void contain(const std::string& lead, const Node& node, const LineSink& sink) const;

    void modifier(std::string_view symbol, const ir::Expression& child, const LineSink& sink) const;
    void comment(const ir::Comment& node, const LineSink& sink) const;
    void special_variable(const ir::SpecialVariable& node, const LineSink& sink) const;
    void echo(const ir::Echo& node, const LineSink& sink) const;

    std::string parameters(const std::vector<ir::Field>& fields, const ir::NodeInfo& info) const;
};

// Convenience wrapper around a default Transpiler.
std::vector<std::string> transpile(const ir::Expression& expression);

}  // namespace scad
}  // namespace csgir

#endif // CSGIR_TRANSPILER_TRANSPILER_HPP
