#include "transpiler.hpp"
#include "format.hpp"
#include <math/angle.hpp>

namespace csgir {
namespace scad {

namespace {

ir::Value to_degrees(const ir::Value& radians) {
    if (radians.is_list()) {
        ir::ValueList degrees;
        for (const auto& v : radians.as_list()) {
            degrees.push_back(to_degrees(v));
        }
        return degrees;
    }
    return snap_degrees(radians_to_degrees(radians.as_number()));
}

}  // namespace

void Transpiler::transpile(const ir::Expression& expression, const LineSink& sink) const {
    std::visit([&](const auto& node) {
        using T = std::decay_t<decltype(node)>;

        if constexpr (std::is_same_v<T, ir::Background2D> || std::is_same_v<T, ir::Background3D> ||
                      std::is_same_v<T, ir::Debug2D> || std::is_same_v<T, ir::Debug3D> ||
                      std::is_same_v<T, ir::Root2D> || std::is_same_v<T, ir::Root3D> ||
                      std::is_same_v<T, ir::Disable2D> || std::is_same_v<T, ir::Disable3D>) {
            modifier(T::info.keyword, *node.child, sink);
        }
        else if constexpr (std::is_same_v<T, ir::ModuleDefinition2D> ||
                           std::is_same_v<T, ir::ModuleDefinition3D>) {
            contain("module " + node.name + "() ", node.children, sink);
        }
        else if constexpr (std::is_same_v<T, ir::ModuleCall2D> || std::is_same_v<T, ir::ModuleCall3D>) {
            contain(node.name + "() ", node.children, sink);
        }
        else if constexpr (std::is_same_v<T, ir::ModuleCallND>) {
            sink(node.name + "();");
        }
        else if constexpr (std::is_same_v<T, ir::ModuleChildren>) {
            sink("children();");
        }
        else if constexpr (std::is_same_v<T, ir::Comment>) {
            comment(node, sink);
        }
        else if constexpr (std::is_same_v<T, ir::Commented2D> || std::is_same_v<T, ir::Commented3D>) {
            comment(node.comment, sink);
            transpile(*node.subject, sink);
        }
        else if constexpr (std::is_same_v<T, ir::SpecialVariable>) {
            special_variable(node, sink);
        }
        else if constexpr (std::is_same_v<T, ir::Echo>) {
            echo(node, sink);
        }
        else {
            // Everything else is fully described by its metadata.
            from_metadata(node, sink);
        }
    }, expression.node);
}

std::vector<std::string> Transpiler::transpile(const ir::Expression& expression) const {
    std::vector<std::string> lines;
    transpile(expression, [&lines](const std::string& line) { lines.push_back(line); });
    return lines;
}

template <typename Node>
void Transpiler::from_metadata(const Node& node, const LineSink& sink) const {
    if constexpr (requires { node.validate(); }) {
        node.validate();
    }

    const ir::NodeInfo& info = Node::info;
    std::string lead = std::string(info.keyword) + "(" + parameters(node.fields(), info) + ")";

    if (info.is_container()) {
        contain(lead + " ", node, sink);
    } else {
        sink(lead + ";");
    }
}

template <typename Node>
void Transpiler::contain(const std::string& lead, const Node& node, const LineSink& sink) const {
    bool empty = true;
    ir::for_each_child(node, [&empty](const ir::Expression&) { empty = false; });

    if (empty) {
        sink(lead + "{};");
        return;
    }

    sink(lead + "{");
    LineSink indented = [&sink](const std::string& line) {
        sink(std::string(indentation) + line);
    };
    ir::for_each_child(node, [&](const ir::Expression& child) { transpile(child, indented); });
    sink("};");
}

void Transpiler::contain(const std::string& lead, const ir::Children& body, const LineSink& sink) const {
    if (body.empty()) {
        sink(lead + "{};");
        return;
    }

    sink(lead + "{");
    LineSink indented = [&sink](const std::string& line) {
        sink(std::string(indentation) + line);
    };
    for (const auto& child : body) {
        transpile(child, indented);
    }
    sink("};");
}

void Transpiler::modifier(std::string_view symbol, const ir::Expression& child,
                          const LineSink& sink) const {
    // The symbol attaches to the first statement of the child, in place.
    bool first = true;
    transpile(child, [&](const std::string& line) {
        if (first) {
            first = false;
            sink(std::string(symbol) + line);
        } else {
            sink(line);
        }
    });
}

void Transpiler::comment(const ir::Comment& node, const LineSink& sink) const {
    for (const auto& line : node.lines) {
        sink("// " + line);
    }
}

void Transpiler::special_variable(const ir::SpecialVariable& node, const LineSink& sink) const {
    if (!node.preview) {
        sink(node.name + ";");
    } else if (!node.render) {
        sink(node.name + " = " + format_value(*node.preview) + ";");
    } else {
        sink(node.name + " = $preview ? " + format_value(*node.preview) + " : " +
             format_value(*node.render) + ";");
    }
}

void Transpiler::echo(const ir::Echo& node, const LineSink& sink) const {
    std::string args;
    for (std::size_t i = 0; i < node.content.size(); ++i) {
        if (i > 0) args += ", ";
        args += format_value(node.content[i]);
    }
    sink("echo(" + args + ");");
}

std::string Transpiler::parameters(const std::vector<ir::Field>& fields, const ir::NodeInfo& info) const {
    std::string head;
    for (const auto& field : fields) {
        if (field.fallback && field.value == *field.fallback) {
            continue;
        }
        const ir::Value value = field.angle ? to_degrees(field.value) : field.value;
        if (!head.empty()) {
            head += ", ";
        }
        head += std::string(info.parameter_name(field.name)) + "=" + format_value(value);
    }
    return head;
}

std::vector<std::string> transpile(const ir::Expression& expression) {
    return Transpiler{}.transpile(expression);
}

}  // namespace scad
}  // namespace csgir
