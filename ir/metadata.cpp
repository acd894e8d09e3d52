#include "expression.hpp"
#include <common/errors.hpp>
#include <sstream>

namespace csgir {
namespace ir {

namespace {

constexpr FieldAlias radius_aliases[] = {{"radius", "r"}};
constexpr FieldAlias cylinder_aliases[] = {{"radius", "r"}, {"height", "h"}};
constexpr FieldAlias frustum_aliases[] = {
    {"radius_bottom", "r1"}, {"radius_top", "r2"}, {"height", "h"}};
constexpr FieldAlias vector_aliases[] = {{"vector", "v"}};
constexpr FieldAlias angle_aliases[] = {{"angle", "a"}};
constexpr FieldAlias resize_aliases[] = {{"size", "newsize"}};
constexpr FieldAlias matrix_aliases[] = {{"matrix", "m"}};
constexpr FieldAlias color_aliases[] = {{"color", "c"}};
constexpr FieldAlias rounded_offset_aliases[] = {{"distance", "r"}};
constexpr FieldAlias angled_offset_aliases[] = {{"distance", "delta"}};

constexpr auto TwoD = Dimensionality::TwoD;
constexpr auto ThreeD = Dimensionality::ThreeD;
constexpr auto ND = Dimensionality::DimensionFree;

template <typename T>
const T& defaults() {
    static const T instance{};
    return instance;
}

Field required(std::string_view name, Value value, bool angle = false) {
    return Field{name, std::move(value), std::nullopt, angle};
}

Field defaulted(std::string_view name, Value value, Value fallback, bool angle = false) {
    return Field{name, std::move(value), std::move(fallback), angle};
}

void check_indices(const Indices& lists, std::size_t point_count, std::size_t minimum,
                   const char* what) {
    for (std::size_t i = 0; i < lists.size(); ++i) {
        if (lists[i].size() < minimum) {
            std::ostringstream oss;
            oss << "The " << what << " in place " << i + 1 << " has " << lists[i].size()
                << " indices; at least " << minimum << " are needed.";
            throw ConstructionError(oss.str());
        }
        for (int index : lists[i]) {
            if (index < 0 || static_cast<std::size_t>(index) >= point_count) {
                std::ostringstream oss;
                oss << "Index " << index << " in " << what << " " << i + 1
                    << " is out of range for " << point_count << " points.";
                throw ConstructionError(oss.str());
            }
        }
    }
}

Value color_value(const ColorValue& color) {
    return std::visit([](const auto& c) { return Value(c); }, color);
}

}  // namespace

// clang-format off
const NodeInfo Circle::info{"circle", TwoD, "", radius_aliases};
const NodeInfo Square::info{"square", TwoD, "", {}};
const NodeInfo Rectangle::info{"square", TwoD, "", {}};
const NodeInfo Polygon::info{"polygon", TwoD, "", {}};
const NodeInfo Text::info{"text", TwoD, "", {}};
const NodeInfo Import2D::info{"import", TwoD, "", {}};
const NodeInfo Projection::info{"projection", TwoD, "child", {}};

const NodeInfo Sphere::info{"sphere", ThreeD, "", radius_aliases};
const NodeInfo Cube::info{"cube", ThreeD, "", {}};
const NodeInfo Cylinder::info{"cylinder", ThreeD, "", cylinder_aliases};
const NodeInfo Frustum::info{"cylinder", ThreeD, "", frustum_aliases};
const NodeInfo Polyhedron::info{"polyhedron", ThreeD, "", {}};
const NodeInfo Import3D::info{"import", ThreeD, "", {}};
const NodeInfo Surface::info{"surface", ThreeD, "", {}};

const NodeInfo Union2D::info{"union", TwoD, "children", {}};
const NodeInfo Union3D::info{"union", ThreeD, "children", {}};
const NodeInfo Difference2D::info{"difference", TwoD, "children", {}};
const NodeInfo Difference3D::info{"difference", ThreeD, "children", {}};
const NodeInfo Intersection2D::info{"intersection", TwoD, "children", {}};
const NodeInfo Intersection3D::info{"intersection", ThreeD, "children", {}};

const NodeInfo Translation2D::info{"translate", TwoD, "children", vector_aliases};
const NodeInfo Translation3D::info{"translate", ThreeD, "children", vector_aliases};
const NodeInfo Rotation2D::info{"rotate", TwoD, "children", angle_aliases};
const NodeInfo Rotation3D::info{"rotate", ThreeD, "children", angle_aliases};
const NodeInfo Scaling2D::info{"scale", TwoD, "children", vector_aliases};
const NodeInfo Scaling3D::info{"scale", ThreeD, "children", vector_aliases};
const NodeInfo Resize2D::info{"resize", TwoD, "children", resize_aliases};
const NodeInfo Resize3D::info{"resize", ThreeD, "children", resize_aliases};
const NodeInfo Mirror2D::info{"mirror", TwoD, "children", vector_aliases};
const NodeInfo Mirror3D::info{"mirror", ThreeD, "children", vector_aliases};
const NodeInfo Affine2D::info{"multmatrix", TwoD, "children", matrix_aliases};
const NodeInfo Affine3D::info{"multmatrix", ThreeD, "children", matrix_aliases};
const NodeInfo Color2D::info{"color", TwoD, "children", color_aliases};
const NodeInfo Color3D::info{"color", ThreeD, "children", color_aliases};
const NodeInfo RoundedOffset::info{"offset", TwoD, "children", rounded_offset_aliases};
const NodeInfo AngledOffset::info{"offset", TwoD, "children", angled_offset_aliases};
const NodeInfo Hull2D::info{"hull", TwoD, "children", {}};
const NodeInfo Hull3D::info{"hull", ThreeD, "children", {}};
const NodeInfo Minkowski2D::info{"minkowski", TwoD, "children", {}};
const NodeInfo Minkowski3D::info{"minkowski", ThreeD, "children", {}};
const NodeInfo Render3D::info{"render", ThreeD, "children", {}};

const NodeInfo LinearExtrusion::info{"linear_extrude", ThreeD, "children", {}};
const NodeInfo RotationalExtrusion::info{"rotate_extrude", ThreeD, "children", {}};

const NodeInfo Background2D::info{"%", TwoD, "child", {}};
const NodeInfo Background3D::info{"%", ThreeD, "child", {}};
const NodeInfo Debug2D::info{"#", TwoD, "child", {}};
const NodeInfo Debug3D::info{"#", ThreeD, "child", {}};
const NodeInfo Root2D::info{"!", TwoD, "child", {}};
const NodeInfo Root3D::info{"!", ThreeD, "child", {}};
const NodeInfo Disable2D::info{"*", TwoD, "child", {}};
const NodeInfo Disable3D::info{"*", ThreeD, "child", {}};

const NodeInfo ModuleDefinition2D::info{"module", TwoD, "children", {}};
const NodeInfo ModuleDefinition3D::info{"module", ThreeD, "children", {}};
const NodeInfo ModuleCall2D::info{"", TwoD, "children", {}};
const NodeInfo ModuleCall3D::info{"", ThreeD, "children", {}};
const NodeInfo ModuleCallND::info{"", ND, "", {}};
const NodeInfo ModuleChildren::info{"children", ND, "", {}};

const NodeInfo Comment::info{"//", ND, "", {}};
const NodeInfo Commented2D::info{"//", TwoD, "subject", {}};
const NodeInfo Commented3D::info{"//", ThreeD, "subject", {}};
const NodeInfo SpecialVariable::info{"$", ND, "", {}};
const NodeInfo Echo::info{"echo", ND, "", {}};
// clang-format on

// ============== Field lists ==============

std::vector<Field> Circle::fields() const {
    return {required("radius", radius)};
}

std::vector<Field> Square::fields() const {
    return {required("size", size), defaulted("center", center, defaults<Square>().center)};
}

std::vector<Field> Rectangle::fields() const {
    return {required("size", size), defaulted("center", center, defaults<Rectangle>().center)};
}

std::vector<Field> Polygon::fields() const {
    const auto& d = defaults<Polygon>();
    return {
        required("points", points),
        defaulted("paths", paths, d.paths),
        defaulted("convexity", convexity, d.convexity),
    };
}

void Polygon::validate() const {
    check_indices(paths, points.size(), 1, "path");
}

std::vector<Field> Text::fields() const {
    const auto& d = defaults<Text>();
    return {
        required("text", text),
        defaulted("size", size, d.size),
        defaulted("font", font, d.font),
        defaulted("halign", halign, d.halign),
        defaulted("valign", valign, d.valign),
        defaulted("spacing", spacing, d.spacing),
        defaulted("direction", direction, d.direction),
        defaulted("language", language, d.language),
        defaulted("script", script, d.script),
    };
}

std::vector<Field> Import2D::fields() const {
    const auto& d = defaults<Import2D>();
    return {
        required("file", file),
        defaulted("layer", layer, d.layer),
        defaulted("convexity", convexity, d.convexity),
    };
}

std::vector<Field> Projection::fields() const {
    return {defaulted("cut", cut, false)};
}

std::vector<Field> Sphere::fields() const {
    return {required("radius", radius)};
}

std::vector<Field> Cube::fields() const {
    return {required("size", size), defaulted("center", center, defaults<Cube>().center)};
}

std::vector<Field> Cylinder::fields() const {
    return {
        required("radius", radius),
        required("height", height),
        defaulted("center", center, defaults<Cylinder>().center),
    };
}

std::vector<Field> Frustum::fields() const {
    return {
        required("radius_bottom", radius_bottom),
        required("radius_top", radius_top),
        required("height", height),
        defaulted("center", center, defaults<Frustum>().center),
    };
}

std::vector<Field> Polyhedron::fields() const {
    return {
        required("points", points),
        required("faces", faces),
        defaulted("convexity", convexity, defaults<Polyhedron>().convexity),
    };
}

void Polyhedron::validate() const {
    check_indices(faces, points.size(), 3, "face");
}

std::vector<Field> Import3D::fields() const {
    return {
        required("file", file),
        defaulted("convexity", convexity, defaults<Import3D>().convexity),
    };
}

std::vector<Field> Surface::fields() const {
    const auto& d = defaults<Surface>();
    return {
        required("file", file),
        defaulted("center", center, d.center),
        defaulted("invert", invert, d.invert),
        defaulted("convexity", convexity, d.convexity),
    };
}

std::vector<Field> Union2D::fields() const { return {}; }
std::vector<Field> Union3D::fields() const { return {}; }
std::vector<Field> Difference2D::fields() const { return {}; }
std::vector<Field> Difference3D::fields() const { return {}; }
std::vector<Field> Intersection2D::fields() const { return {}; }
std::vector<Field> Intersection3D::fields() const { return {}; }

std::vector<Field> Translation2D::fields() const { return {required("vector", vector)}; }
std::vector<Field> Translation3D::fields() const { return {required("vector", vector)}; }
std::vector<Field> Rotation2D::fields() const { return {required("angle", angle, true)}; }
std::vector<Field> Rotation3D::fields() const { return {required("angle", angle, true)}; }
std::vector<Field> Scaling2D::fields() const { return {required("vector", vector)}; }
std::vector<Field> Scaling3D::fields() const { return {required("vector", vector)}; }
std::vector<Field> Resize2D::fields() const { return {required("size", size)}; }
std::vector<Field> Resize3D::fields() const { return {required("size", size)}; }
std::vector<Field> Mirror2D::fields() const { return {required("vector", vector)}; }
std::vector<Field> Mirror3D::fields() const { return {required("vector", vector)}; }
std::vector<Field> Affine2D::fields() const { return {required("matrix", matrix)}; }
std::vector<Field> Affine3D::fields() const { return {required("matrix", matrix)}; }
std::vector<Field> Color2D::fields() const { return {required("color", color_value(color))}; }
std::vector<Field> Color3D::fields() const { return {required("color", color_value(color))}; }

std::vector<Field> RoundedOffset::fields() const {
    return {required("distance", distance)};
}

std::vector<Field> AngledOffset::fields() const {
    return {
        required("distance", distance),
        defaulted("chamfer", chamfer, defaults<AngledOffset>().chamfer),
    };
}

std::vector<Field> Hull2D::fields() const { return {}; }
std::vector<Field> Hull3D::fields() const { return {}; }

std::vector<Field> Minkowski2D::fields() const {
    return {defaulted("convexity", convexity, defaults<Minkowski2D>().convexity)};
}

std::vector<Field> Minkowski3D::fields() const {
    return {defaulted("convexity", convexity, defaults<Minkowski3D>().convexity)};
}

std::vector<Field> Render3D::fields() const {
    return {defaulted("convexity", convexity, defaults<Render3D>().convexity)};
}

std::vector<Field> LinearExtrusion::fields() const {
    const auto& d = defaults<LinearExtrusion>();
    std::vector<Field> result{
        required("height", height),
        defaulted("center", center, d.center),
        defaulted("convexity", convexity, d.convexity),
        defaulted("twist", twist, d.twist, true),
    };
    if (slices) {
        result.push_back(required("slices", *slices));
    }
    result.push_back(defaulted("scale", scale, d.scale));
    return result;
}

std::vector<Field> RotationalExtrusion::fields() const {
    const auto& d = defaults<RotationalExtrusion>();
    return {
        defaulted("angle", angle, d.angle, true),
        defaulted("convexity", convexity, d.convexity),
    };
}

}  // namespace ir
}  // namespace csgir
