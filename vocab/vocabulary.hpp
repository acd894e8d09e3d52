#ifndef CSGIR_VOCAB_VOCABULARY_HPP
#define CSGIR_VOCAB_VOCABULARY_HPP

#include "dimensionality.hpp"
#include <ir/expression.hpp>
#include <filesystem>
#include <numbers>
#include <optional>
#include <string>
#include <vector>

namespace csgir {
namespace vocab {

using ir::Children;
using ir::Expression;

// Smart constructors. Each one picks the 2D or 3D variant of its node from the
// children it is given and rejects mixed or forbidden dimensionality up front.
// Shape helpers center by default; the IR default is uncentered.

// ============== Metadata ==============

Expression comment(std::vector<std::string> lines);
Expression comment(std::vector<std::string> lines, const Expression& subject);

// Read a special variable such as "$fn", assign it, or assign it by $preview.
Expression special(std::string variable);
Expression special(std::string variable, ir::Value value);
Expression special(std::string variable, ir::Value preview, ir::Value render);

Expression echo(std::vector<ir::Value> content);

// ============== Modifiers ==============

enum class Modifier {
    Background,
    Debug,
    Root,
    Disable,
};

Expression background(const Expression& child);
Expression debug(const Expression& child);
Expression root(const Expression& child);
Expression disable(const Expression& child);

// Apply a modifier to exactly one child.
Expression modify(Modifier modifier, const Children& children);

// ============== Booleans ==============

Expression union_(Children children);
Expression difference(Children children);
Expression intersection(Children children);

// ============== 2D shapes ==============

Expression circle(double radius);
Expression square(double size, bool center = true);
Expression square(ir::Vec2 size, bool center = true);
Expression polygon(std::vector<ir::Vec2> points, ir::Indices paths = {}, int convexity = 1);
Expression text(std::string content);
Expression text(ir::Text layout);

// The file suffix decides between 2D (.dxf, .svg) and 3D (.3mf, .amf, .off, .stl).
Expression import_file(const std::filesystem::path& file, int convexity = 1, std::string layer = {});

Expression projection(const Expression& child, bool cut = false);
Expression cut(const Expression& child);

// ============== 3D shapes ==============

Expression sphere(double radius);
Expression cube(ir::Vec3 size, bool center = true);
Expression cylinder(double radius, double height, bool center = true);
Expression cylinder(ir::Vec2 radii, double height, bool center = true);
Expression polyhedron(std::vector<ir::Vec3> points, ir::Indices faces, int convexity = 1);
Expression surface(const std::filesystem::path& file, bool center = true, bool invert = false,
                   int convexity = 1);

// ============== Extrusions ==============

struct ExtrudeOptions {
    std::optional<bool> rotate;     // unset: rotate when an angle is given
    std::optional<double> height;   // required for linear extrusion
    std::optional<double> angle;    // radians
    bool center = false;
    int convexity = 1;
    double twist = 0;               // radians
    std::optional<int> slices;
    double scale = 1;
};

Expression extrude(Children children, const ExtrudeOptions& options);
Expression linear_extrude(double height, Children children);
Expression rotate_extrude(Children children, double angle = 2 * std::numbers::pi, int convexity = 1);

// ============== Transformations ==============

Expression translate(const std::vector<double>& vector, Children children);

// A scalar angle on 3D children rotates about the z axis. Radians.
Expression rotate(double angle, Children children);
Expression rotate(ir::Vec3 angles, Children children);

Expression scale(const std::vector<double>& factors, Children children);
Expression resize(const std::vector<double>& size, Children children);

// The axes need not match the dimensionality of the children.
Expression mirror(ir::MirrorAxes axes, Children children);

Expression multmatrix(ir::Matrix matrix, Children children);
Expression color(ir::ColorValue value, Children children);

// Rounded offset by default; chamfer applies to angled offsets only.
Expression offset(double distance, Children children, bool round = true, bool chamfer = false);

Expression hull(Children children);
Expression minkowski(Children children, int convexity = 1);
Expression render(Children children, int convexity = 1);

// ============== Modules ==============

// Define a named module. A module body needs at least one child.
Expression define_module(std::string name, Children children);

// Call a module, optionally passing children to it.
Expression call_module(std::string name, Children children = {});

Expression children();

}  // namespace vocab
}  // namespace csgir

#endif // CSGIR_VOCAB_VOCABULARY_HPP
