#ifndef CSGIR_IR_EXPRESSION_HPP
#define CSGIR_IR_EXPRESSION_HPP

#include "node_info.hpp"
#include "value.hpp"
#include <filesystem>
#include <memory>
#include <numbers>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace csgir {
namespace ir {

struct Expression;

// One declared, non-child field of a node, in definition order.
struct Field {
    std::string_view name;
    Value value;
    std::optional<Value> fallback;  // canonical default, if the field has one
    bool angle = false;             // stored in radians
};

// Shared, immutable single child. Compares by content.
class Child {
public:
    Child(Expression expression);

    const Expression& operator*() const { return *expression_; }
    const Expression* operator->() const { return expression_.get(); }

    bool operator==(const Child& other) const;

private:
    std::shared_ptr<const Expression> expression_;
};

using Children = std::vector<Expression>;
using Indices = std::vector<std::vector<int>>;
using Matrix = std::vector<Vec4>;
using MirrorAxes = std::array<int, 3>;
using ColorValue = std::variant<Vec4, std::string>;

// ============== 2D shapes ==============

struct Circle {
    double radius;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Circle&) const = default;
};

struct Square {
    double size;
    bool center = false;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Square&) const = default;
};

struct Rectangle {
    Vec2 size;
    bool center = false;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Rectangle&) const = default;
};

struct Polygon {
    std::vector<Vec2> points;
    Indices paths;
    int convexity = 1;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    void validate() const;  // throws ConstructionError on bad path indices
    bool operator==(const Polygon&) const = default;
};

struct Text {
    std::string text;
    double size = 10;
    std::string font;
    std::string halign = "left";
    std::string valign = "baseline";
    double spacing = 1;
    std::string direction = "ltr";
    std::string language = "en";
    std::string script = "latin";

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Text&) const = default;
};

struct Import2D {
    std::filesystem::path file;
    std::string layer;
    int convexity = 1;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Import2D&) const = default;
};

// Flattens a 3D child onto the XY plane.
struct Projection {
    Child child;
    bool cut = false;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Projection&) const = default;
};

// ============== 3D shapes ==============

struct Sphere {
    double radius;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Sphere&) const = default;
};

struct Cube {
    Vec3 size;
    bool center = false;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Cube&) const = default;
};

struct Cylinder {
    double radius;
    double height;
    bool center = false;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Cylinder&) const = default;
};

struct Frustum {
    double radius_bottom;
    double radius_top;
    double height;
    bool center = false;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Frustum&) const = default;
};

struct Polyhedron {
    std::vector<Vec3> points;
    Indices faces;
    int convexity = 1;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    void validate() const;  // throws ConstructionError on bad faces
    bool operator==(const Polyhedron&) const = default;
};

struct Import3D {
    std::filesystem::path file;
    int convexity = 1;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Import3D&) const = default;
};

// Height field read from an image or data file.
struct Surface {
    std::filesystem::path file;
    bool center = false;
    bool invert = false;
    int convexity = 1;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Surface&) const = default;
};

// ============== Booleans ==============

struct Union2D {
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Union2D&) const = default;
};

struct Union3D {
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Union3D&) const = default;
};

// The first child is the minuend.
struct Difference2D {
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Difference2D&) const = default;
};

struct Difference3D {
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Difference3D&) const = default;
};

struct Intersection2D {
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Intersection2D&) const = default;
};

struct Intersection3D {
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Intersection3D&) const = default;
};

// ============== Transformations ==============

struct Translation2D {
    Vec2 vector;
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Translation2D&) const = default;
};

struct Translation3D {
    Vec3 vector;
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Translation3D&) const = default;
};

// Angles are in radians.
struct Rotation2D {
    double angle;
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Rotation2D&) const = default;
};

struct Rotation3D {
    Vec3 angle;
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Rotation3D&) const = default;
};

struct Scaling2D {
    Vec2 vector;
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Scaling2D&) const = default;
};

struct Scaling3D {
    Vec3 vector;
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Scaling3D&) const = default;
};

struct Resize2D {
    Vec2 size;
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Resize2D&) const = default;
};

struct Resize3D {
    Vec3 size;
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Resize3D&) const = default;
};

// The axes are the normal of the mirroring plane, for either dimensionality.
struct Mirror2D {
    MirrorAxes vector;
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Mirror2D&) const = default;
};

struct Mirror3D {
    MirrorAxes vector;
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Mirror3D&) const = default;
};

struct Affine2D {
    Matrix matrix;
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Affine2D&) const = default;
};

struct Affine3D {
    Matrix matrix;
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Affine3D&) const = default;
};

struct Color2D {
    ColorValue color;
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Color2D&) const = default;
};

struct Color3D {
    ColorValue color;
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Color3D&) const = default;
};

struct RoundedOffset {
    double distance;
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const RoundedOffset&) const = default;
};

struct AngledOffset {
    double distance;
    Children children;
    bool chamfer = false;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const AngledOffset&) const = default;
};

struct Hull2D {
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Hull2D&) const = default;
};

struct Hull3D {
    Children children;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Hull3D&) const = default;
};

struct Minkowski2D {
    Children children;
    int convexity = 1;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Minkowski2D&) const = default;
};

struct Minkowski3D {
    Children children;
    int convexity = 1;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Minkowski3D&) const = default;
};

// Forces full evaluation of the subtree in preview.
struct Render3D {
    Children children;
    int convexity = 1;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const Render3D&) const = default;
};

// ============== Extrusions ==============

struct LinearExtrusion {
    Children children;
    double height;
    bool center = false;
    int convexity = 1;
    double twist = 0;                 // radians
    std::optional<int> slices;        // renderer picks when absent
    double scale = 1;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const LinearExtrusion&) const = default;
};

struct RotationalExtrusion {
    Children children;
    double angle = 2 * std::numbers::pi;
    int convexity = 1;

    static const NodeInfo info;
    std::vector<Field> fields() const;
    bool operator==(const RotationalExtrusion&) const = default;
};

// ============== Modifiers ==============
//
// A modifier prefixes a single statement; it has no parameters.

struct Background2D {
    Child child;
    static const NodeInfo info;
    bool operator==(const Background2D&) const = default;
};

struct Background3D {
    Child child;
    static const NodeInfo info;
    bool operator==(const Background3D&) const = default;
};

struct Debug2D {
    Child child;
    static const NodeInfo info;
    bool operator==(const Debug2D&) const = default;
};

struct Debug3D {
    Child child;
    static const NodeInfo info;
    bool operator==(const Debug3D&) const = default;
};

struct Root2D {
    Child child;
    static const NodeInfo info;
    bool operator==(const Root2D&) const = default;
};

struct Root3D {
    Child child;
    static const NodeInfo info;
    bool operator==(const Root3D&) const = default;
};

struct Disable2D {
    Child child;
    static const NodeInfo info;
    bool operator==(const Disable2D&) const = default;
};

struct Disable3D {
    Child child;
    static const NodeInfo info;
    bool operator==(const Disable3D&) const = default;
};

// ============== Modules ==============

struct ModuleDefinition2D {
    std::string name;
    Children children;
    static const NodeInfo info;
    bool operator==(const ModuleDefinition2D&) const = default;
};

struct ModuleDefinition3D {
    std::string name;
    Children children;
    static const NodeInfo info;
    bool operator==(const ModuleDefinition3D&) const = default;
};

struct ModuleCall2D {
    std::string name;
    Children children;
    static const NodeInfo info;
    bool operator==(const ModuleCall2D&) const = default;
};

struct ModuleCall3D {
    std::string name;
    Children children;
    static const NodeInfo info;
    bool operator==(const ModuleCall3D&) const = default;
};

// A call without children; its geometry is unknown here.
struct ModuleCallND {
    std::string name;
    static const NodeInfo info;
    bool operator==(const ModuleCallND&) const = default;
};

// Marks where a module body places the children of its call site.
struct ModuleChildren {
    static const NodeInfo info;
    bool operator==(const ModuleChildren&) const = default;
};

// ============== Metadata ==============

struct Comment {
    std::vector<std::string> lines;
    static const NodeInfo info;
    bool operator==(const Comment&) const = default;
};

struct Commented2D {
    Comment comment;
    Child subject;
    static const NodeInfo info;
    bool operator==(const Commented2D&) const = default;
};

struct Commented3D {
    Comment comment;
    Child subject;
    static const NodeInfo info;
    bool operator==(const Commented3D&) const = default;
};

// Reads $name, assigns it, or assigns it by $preview.
struct SpecialVariable {
    std::string name;
    std::optional<Value> preview;
    std::optional<Value> render;
    static const NodeInfo info;
    bool operator==(const SpecialVariable&) const = default;
};

struct Echo {
    std::vector<Value> content;
    static const NodeInfo info;
    bool operator==(const Echo&) const = default;
};

using Node = std::variant<
    Circle, Square, Rectangle, Polygon, Text, Import2D, Projection,
    Sphere, Cube, Cylinder, Frustum, Polyhedron, Import3D, Surface,
    Union2D, Union3D, Difference2D, Difference3D, Intersection2D, Intersection3D,
    Translation2D, Translation3D, Rotation2D, Rotation3D,
    Scaling2D, Scaling3D, Resize2D, Resize3D, Mirror2D, Mirror3D,
    Affine2D, Affine3D, Color2D, Color3D,
    RoundedOffset, AngledOffset, Hull2D, Hull3D, Minkowski2D, Minkowski3D, Render3D,
    LinearExtrusion, RotationalExtrusion,
    Background2D, Background3D, Debug2D, Debug3D,
    Root2D, Root3D, Disable2D, Disable3D,
    ModuleDefinition2D, ModuleDefinition3D, ModuleCall2D, ModuleCall3D,
    ModuleCallND, ModuleChildren,
    Comment, Commented2D, Commented3D, SpecialVariable, Echo
>;

template <typename T, typename Variant>
struct is_alternative;

template <typename T, typename... Ts>
struct is_alternative<T, std::variant<Ts...>>
    : std::bool_constant<(std::is_same_v<T, Ts> || ...)> {};

template <typename T>
inline constexpr bool is_node_v = is_alternative<std::decay_t<T>, Node>::value;

// An immutable IR tree. Equality is structural.
struct Expression {
    Node node;

    template <typename T, typename = std::enable_if_t<is_node_v<T>>>
    Expression(T n) : node(std::move(n)) {}

    template <typename T>
    bool holds() const { return std::holds_alternative<T>(node); }

    template <typename T>
    const T& as() const { return std::get<T>(node); }

    bool operator==(const Expression& other) const = default;
};

Dimensionality dimensionality(const Expression& expression);
const NodeInfo& info(const Expression& expression);

inline bool is_2d(const Expression& e) { return dimensionality(e) == Dimensionality::TwoD; }
inline bool is_3d(const Expression& e) { return dimensionality(e) == Dimensionality::ThreeD; }

// Visit the children of a node in stored order; a single child counts as one.
template <typename T, typename Fn>
void for_each_child(const T& node, Fn&& fn) {
    if constexpr (requires { node.children; }) {
        for (const auto& child : node.children) {
            fn(child);
        }
    } else if constexpr (requires { node.child; }) {
        fn(*node.child);
    }
}

}  // namespace ir
}  // namespace csgir

#endif // CSGIR_IR_EXPRESSION_HPP
