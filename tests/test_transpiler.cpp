#include <transpiler/transpiler.hpp>
#include <vocab/vocabulary.hpp>
#include <common/errors.hpp>
#include <gtest/gtest.h>
#include <numbers>

using namespace csgir;
using namespace csgir::vocab;
using Lines = std::vector<std::string>;

// ============== Leaves ==============

TEST(Transpiler, DefaultCenterElided) {
    EXPECT_EQ(scad::transpile(ir::Cube{{10, 10, 10}, false}), Lines{"cube(size=[10, 10, 10]);"});
    EXPECT_EQ(scad::transpile(ir::Cube{{10, 10, 10}, true}),
              Lines{"cube(size=[10, 10, 10], center=true);"});
}

TEST(Transpiler, IntegralRealsLoseDecimals) {
    EXPECT_EQ(scad::transpile(circle(5.0)), Lines{"circle(r=5);"});
    EXPECT_EQ(scad::transpile(circle(5.5)), Lines{"circle(r=5.5);"});
}

TEST(Transpiler, FieldNamesRemapped) {
    EXPECT_EQ(scad::transpile(cylinder(1, 2, false)), Lines{"cylinder(r=1, h=2);"});
    EXPECT_EQ(scad::transpile(cylinder({2, 1}, 3)), Lines{"cylinder(r1=2, r2=1, h=3, center=true);"});
    EXPECT_EQ(scad::transpile(square({4, 2})), Lines{"square(size=[4, 2], center=true);"});
}

TEST(Transpiler, TextDefaultsElided) {
    ir::Text label;
    label.text = "Label";
    label.halign = "center";
    EXPECT_EQ(scad::transpile(label), Lines{"text(text=\"Label\", halign=\"center\");"});
}

TEST(Transpiler, StringNeedingEscapesRejected) {
    EXPECT_THROW(scad::transpile(text("He said \"hi\"")), StringEncodingError);
}

TEST(Transpiler, InvalidPolygonRejected) {
    ir::Polygon broken{{{0, 0}, {1, 0}}, {{0, 1, 5}}};
    EXPECT_THROW(scad::transpile(broken), ConstructionError);
}

// ============== Containers ==============

TEST(Transpiler, RotationInDegrees) {
    Lines expected = {
        "rotate(a=90) {",
        "    circle(r=1);",
        "};",
    };
    EXPECT_EQ(scad::transpile(rotate(std::numbers::pi / 2, {circle(1)})), expected);
}

TEST(Transpiler, RotationVectorInDegrees) {
    Expression turned = rotate(ir::Vec3{std::numbers::pi, 0, std::numbers::pi / 4}, {sphere(1)});
    EXPECT_EQ(scad::transpile(turned).front(), "rotate(a=[180, 0, 45]) {");
}

TEST(Transpiler, EmptyContainer) {
    EXPECT_EQ(scad::transpile(union_({})), Lines{"union() {};"});
}

TEST(Transpiler, NestedIndentation) {
    Expression tree = difference({
        square({10, 10}),
        translate({5, 5}, {circle(2)}),
    });
    Lines expected = {
        "difference() {",
        "    square(size=[10, 10], center=true);",
        "    translate(v=[5, 5]) {",
        "        circle(r=2);",
        "    };",
        "};",
    };
    EXPECT_EQ(scad::transpile(tree), expected);
}

TEST(Transpiler, ExtrusionAngles) {
    ExtrudeOptions options;
    options.height = 2;
    options.twist = std::numbers::pi;
    options.slices = 20;
    Expression twisted = extrude({circle(1)}, options);
    EXPECT_EQ(scad::transpile(twisted).front(), "linear_extrude(height=2, twist=180, slices=20) {");

    EXPECT_EQ(scad::transpile(rotate_extrude({translate({3, 0}, {circle(1)})})).front(),
              "rotate_extrude() {");
    EXPECT_EQ(scad::transpile(rotate_extrude({circle(1)}, std::numbers::pi)).front(),
              "rotate_extrude(angle=180) {");
}

TEST(Transpiler, OffsetVariants) {
    EXPECT_EQ(scad::transpile(offset(1, {circle(1)})).front(), "offset(r=1) {");
    EXPECT_EQ(scad::transpile(offset(-0.5, {circle(1)}, false, true)).front(),
              "offset(delta=-0.5, chamfer=true) {");
}

TEST(Transpiler, ColorByName) {
    EXPECT_EQ(scad::transpile(color("red", {circle(1)})).front(), "color(c=\"red\") {");
    EXPECT_EQ(scad::transpile(color(ir::Vec4{1, 0, 0, 0.5}, {circle(1)})).front(),
              "color(c=[1, 0, 0, 0.5]) {");
}

TEST(Transpiler, Projection) {
    Lines expected = {
        "projection(cut=true) {",
        "    sphere(r=2);",
        "};",
    };
    EXPECT_EQ(scad::transpile(cut(sphere(2))), expected);
}

// ============== Modifiers ==============

TEST(Transpiler, ModifierPrefixesFirstLine) {
    EXPECT_EQ(scad::transpile(debug(circle(1))), Lines{"#circle(r=1);"});

    Lines expected = {
        "%union() {",
        "    sphere(r=1);",
        "};",
    };
    EXPECT_EQ(scad::transpile(background(union_({sphere(1)}))), expected);
    EXPECT_EQ(scad::transpile(root(sphere(1))), Lines{"!sphere(r=1);"});
    EXPECT_EQ(scad::transpile(disable(sphere(1))), Lines{"*sphere(r=1);"});
}

// ============== Modules ==============

TEST(Transpiler, ModuleDefinitionAndCalls) {
    Lines definition = {
        "module arm() {",
        "    cube(size=[1, 2, 3], center=true);",
        "};",
    };
    EXPECT_EQ(scad::transpile(define_module("arm", {cube({1, 2, 3})})), definition);
    EXPECT_EQ(scad::transpile(call_module("arm")), Lines{"arm();"});

    Lines call = {
        "frame() {",
        "    circle(r=1);",
        "};",
    };
    EXPECT_EQ(scad::transpile(call_module("frame", {circle(1)})), call);
    EXPECT_EQ(scad::transpile(children()), Lines{"children();"});
}

// ============== Metadata ==============

TEST(Transpiler, Comments) {
    EXPECT_EQ(scad::transpile(comment({"first", "second"})), (Lines{"// first", "// second"}));
    EXPECT_EQ(scad::transpile(comment({"note"}, circle(1))), (Lines{"// note", "circle(r=1);"}));
}

TEST(Transpiler, SpecialVariables) {
    EXPECT_EQ(scad::transpile(special("$fn")), Lines{"$fn;"});
    EXPECT_EQ(scad::transpile(special("$fn", 12)), Lines{"$fn = 12;"});
    EXPECT_EQ(scad::transpile(special("$fn", 32, 128)), Lines{"$fn = $preview ? 32 : 128;"});
}

TEST(Transpiler, Echo) {
    EXPECT_EQ(scad::transpile(echo({"width", 2.5, true})), Lines{"echo(\"width\", 2.5, true);"});
}

// ============== Properties ==============

TEST(Transpiler, Idempotent) {
    Expression tree = union_({
        special("$fa", 2),
        hull({sphere(1), translate({0, 0, 5}, {sphere(1)})}),
        render({difference({cube({4, 4, 4}), sphere(2.5)})}),
    });
    scad::Transpiler transpiler;
    EXPECT_EQ(transpiler.transpile(tree), transpiler.transpile(tree));
}

TEST(Transpiler, StreamsParentBeforeChildren) {
    Lines seen;
    scad::Transpiler transpiler;
    transpiler.transpile(union_({sphere(1), sphere(2)}),
                         [&seen](const std::string& line) { seen.push_back(line); });
    ASSERT_EQ(seen.size(), 4u);
    EXPECT_EQ(seen[0], "union() {");
    EXPECT_EQ(seen[1], "    sphere(r=1);");
    EXPECT_EQ(seen[2], "    sphere(r=2);");
}
