#include "vocabulary.hpp"
#include <common/errors.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace csgir {
namespace vocab {

using ir::Dimensionality;

namespace {

template <typename T2, typename T3>
Expression contain(std::string_view verb, Children children) {
    if (classify(verb, children) == Dimensionality::TwoD) {
        return T2{std::move(children)};
    }
    return T3{std::move(children)};
}

template <typename T2, typename T3>
Expression wrap(std::string_view verb, const Expression& child) {
    if (classify(verb, std::span<const Expression>(&child, 1)) == Dimensionality::TwoD) {
        return T2{child};
    }
    return T3{child};
}

ir::Vec2 to_vec2(const std::vector<double>& v) {
    return {v[0], v[1]};
}

ir::Vec3 to_vec3(const std::vector<double>& v) {
    return {v[0], v[1], v[2]};
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}  // namespace

// ============== Metadata ==============

Expression comment(std::vector<std::string> lines) {
    return ir::Comment{std::move(lines)};
}

Expression comment(std::vector<std::string> lines, const Expression& subject) {
    ir::Comment c{std::move(lines)};
    if (classify("comment", std::span<const Expression>(&subject, 1)) == Dimensionality::TwoD) {
        return ir::Commented2D{std::move(c), subject};
    }
    return ir::Commented3D{std::move(c), subject};
}

Expression special(std::string variable) {
    return ir::SpecialVariable{std::move(variable), std::nullopt, std::nullopt};
}

Expression special(std::string variable, ir::Value value) {
    return ir::SpecialVariable{std::move(variable), std::move(value), std::nullopt};
}

Expression special(std::string variable, ir::Value preview, ir::Value render) {
    return ir::SpecialVariable{std::move(variable), std::move(preview), std::move(render)};
}

Expression echo(std::vector<ir::Value> content) {
    return ir::Echo{std::move(content)};
}

// ============== Modifiers ==============

Expression background(const Expression& child) {
    return wrap<ir::Background2D, ir::Background3D>("modify", child);
}

Expression debug(const Expression& child) {
    return wrap<ir::Debug2D, ir::Debug3D>("modify", child);
}

Expression root(const Expression& child) {
    return wrap<ir::Root2D, ir::Root3D>("modify", child);
}

Expression disable(const Expression& child) {
    return wrap<ir::Disable2D, ir::Disable3D>("modify", child);
}

Expression modify(Modifier modifier, const Children& children) {
    if (children.size() != 1) {
        std::ostringstream oss;
        oss << "A modifier takes exactly one expression, not " << children.size() << ".";
        throw ConstructionError(oss.str());
    }
    switch (modifier) {
        case Modifier::Background: return background(children.front());
        case Modifier::Debug: return debug(children.front());
        case Modifier::Root: return root(children.front());
        case Modifier::Disable: return disable(children.front());
    }
    throw ConstructionError("Unknown modifier.");
}

// ============== Booleans ==============

Expression union_(Children children) {
    return contain<ir::Union2D, ir::Union3D>("contain", std::move(children));
}

Expression difference(Children children) {
    return contain<ir::Difference2D, ir::Difference3D>("contain", std::move(children));
}

Expression intersection(Children children) {
    return contain<ir::Intersection2D, ir::Intersection3D>("contain", std::move(children));
}

// ============== 2D shapes ==============

Expression circle(double radius) {
    return ir::Circle{radius};
}

Expression square(double size, bool center) {
    return ir::Square{size, center};
}

Expression square(ir::Vec2 size, bool center) {
    return ir::Rectangle{size, center};
}

Expression polygon(std::vector<ir::Vec2> points, ir::Indices paths, int convexity) {
    ir::Polygon node{std::move(points), std::move(paths), convexity};
    node.validate();
    return node;
}

Expression text(std::string content) {
    ir::Text node;
    node.text = std::move(content);
    return node;
}

Expression text(ir::Text layout) {
    return layout;
}

Expression import_file(const std::filesystem::path& file, int convexity, std::string layer) {
    std::string suffix = lowercase(file.extension().string());

    if (suffix == ".dxf" || suffix == ".svg") {
        return ir::Import2D{file, std::move(layer), convexity};
    }
    if (suffix == ".3mf" || suffix == ".amf" || suffix == ".off" || suffix == ".stl") {
        return ir::Import3D{file, convexity};
    }
    throw ConstructionError("Unknown file suffix for " + file.string() + ".");
}

Expression projection(const Expression& child, bool cut) {
    reject_dimensionality("project", Dimensionality::TwoD, std::span<const Expression>(&child, 1));
    return ir::Projection{child, cut};
}

Expression cut(const Expression& child) {
    return projection(child, true);
}

// ============== 3D shapes ==============

Expression sphere(double radius) {
    return ir::Sphere{radius};
}

Expression cube(ir::Vec3 size, bool center) {
    return ir::Cube{size, center};
}

Expression cylinder(double radius, double height, bool center) {
    return ir::Cylinder{radius, height, center};
}

Expression cylinder(ir::Vec2 radii, double height, bool center) {
    return ir::Frustum{radii[0], radii[1], height, center};
}

Expression polyhedron(std::vector<ir::Vec3> points, ir::Indices faces, int convexity) {
    ir::Polyhedron node{std::move(points), std::move(faces), convexity};
    node.validate();
    return node;
}

Expression surface(const std::filesystem::path& file, bool center, bool invert, int convexity) {
    return ir::Surface{file, center, invert, convexity};
}

// ============== Extrusions ==============

Expression extrude(Children children, const ExtrudeOptions& options) {
    bool rotational = options.rotate.value_or(options.angle.has_value());
    if (rotational) {
        return rotate_extrude(std::move(children),
                              options.angle.value_or(2 * std::numbers::pi),
                              options.convexity);
    }

    if (!options.height) {
        throw ConstructionError("Cannot extrude linearly without a height.");
    }
    reject_dimensionality("extrude", Dimensionality::ThreeD, children);

    ir::LinearExtrusion node{std::move(children), *options.height};
    node.center = options.center;
    node.convexity = options.convexity;
    node.twist = options.twist;
    node.slices = options.slices;
    node.scale = options.scale;
    return node;
}

Expression linear_extrude(double height, Children children) {
    ExtrudeOptions options;
    options.rotate = false;
    options.height = height;
    return extrude(std::move(children), options);
}

Expression rotate_extrude(Children children, double angle, int convexity) {
    reject_dimensionality("extrude", Dimensionality::ThreeD, children);
    return ir::RotationalExtrusion{std::move(children), angle, convexity};
}

// ============== Transformations ==============

Expression translate(const std::vector<double>& vector, Children children) {
    if (match_against_argument("translate", vector, children) == Dimensionality::TwoD) {
        return ir::Translation2D{to_vec2(vector), std::move(children)};
    }
    return ir::Translation3D{to_vec3(vector), std::move(children)};
}

Expression rotate(double angle, Children children) {
    if (!has_dimensioned(children) || classify("rotate", children) == Dimensionality::TwoD) {
        return ir::Rotation2D{angle, std::move(children)};
    }
    return ir::Rotation3D{{0, 0, angle}, std::move(children)};
}

Expression rotate(ir::Vec3 angles, Children children) {
    match_against_argument("rotate", std::vector<double>(angles.begin(), angles.end()), children);
    return ir::Rotation3D{angles, std::move(children)};
}

Expression scale(const std::vector<double>& factors, Children children) {
    if (match_against_argument("scale", factors, children) == Dimensionality::TwoD) {
        return ir::Scaling2D{to_vec2(factors), std::move(children)};
    }
    return ir::Scaling3D{to_vec3(factors), std::move(children)};
}

Expression resize(const std::vector<double>& size, Children children) {
    if (match_against_argument("resize", size, children) == Dimensionality::TwoD) {
        return ir::Resize2D{to_vec2(size), std::move(children)};
    }
    return ir::Resize3D{to_vec3(size), std::move(children)};
}

Expression mirror(ir::MirrorAxes axes, Children children) {
    if (classify("mirror", children) == Dimensionality::TwoD) {
        return ir::Mirror2D{axes, std::move(children)};
    }
    return ir::Mirror3D{axes, std::move(children)};
}

Expression multmatrix(ir::Matrix matrix, Children children) {
    if (classify("transform", children) == Dimensionality::TwoD) {
        return ir::Affine2D{std::move(matrix), std::move(children)};
    }
    return ir::Affine3D{std::move(matrix), std::move(children)};
}

Expression color(ir::ColorValue value, Children children) {
    if (classify("color", children) == Dimensionality::TwoD) {
        return ir::Color2D{std::move(value), std::move(children)};
    }
    return ir::Color3D{std::move(value), std::move(children)};
}

Expression offset(double distance, Children children, bool round, bool chamfer) {
    reject_dimensionality("offset", Dimensionality::ThreeD, children);
    if (round) {
        if (chamfer) {
            throw ConstructionError("Cannot chamfer a rounded offset.");
        }
        return ir::RoundedOffset{distance, std::move(children)};
    }
    return ir::AngledOffset{distance, std::move(children), chamfer};
}

Expression hull(Children children) {
    return contain<ir::Hull2D, ir::Hull3D>("form a hull around", std::move(children));
}

Expression minkowski(Children children, int convexity) {
    if (classify("minkowski-add", children) == Dimensionality::TwoD) {
        return ir::Minkowski2D{std::move(children), convexity};
    }
    return ir::Minkowski3D{std::move(children), convexity};
}

Expression render(Children children, int convexity) {
    // Rendering 2D shapes has no practical use.
    reject_dimensionality("render", Dimensionality::TwoD, children);
    return ir::Render3D{std::move(children), convexity};
}

// ============== Modules ==============

Expression define_module(std::string name, Children children) {
    if (children.empty()) {
        throw ConstructionError("Cannot define module “" + name + "” without children.");
    }
    if (classify("define module of", children) == Dimensionality::TwoD) {
        return ir::ModuleDefinition2D{std::move(name), std::move(children)};
    }
    return ir::ModuleDefinition3D{std::move(name), std::move(children)};
}

Expression call_module(std::string name, Children children) {
    if (children.empty()) {
        return ir::ModuleCallND{std::move(name)};
    }
    if (classify("call module using", children) == Dimensionality::TwoD) {
        return ir::ModuleCall2D{std::move(name), std::move(children)};
    }
    return ir::ModuleCall3D{std::move(name), std::move(children)};
}

Expression children() {
    return ir::ModuleChildren{};
}

}  // namespace vocab
}  // namespace csgir
