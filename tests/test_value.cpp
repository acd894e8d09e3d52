#include <ir/value.hpp>
#include <gtest/gtest.h>

using namespace csgir::ir;

TEST(Value, KindPredicates) {
    EXPECT_TRUE(Value(true).is_bool());
    EXPECT_TRUE(Value(3).is_integer());
    EXPECT_TRUE(Value(3.0).is_real());
    EXPECT_TRUE(Value(3).is_number());
    EXPECT_TRUE(Value("abc").is_string());
    EXPECT_TRUE(Value(Vec3{1, 2, 3}).is_list());
    EXPECT_FALSE(Value(true).is_number());
}

TEST(Value, TypeNames) {
    EXPECT_EQ(type_name(Value(false)), "boolean");
    EXPECT_EQ(type_name(Value(1)), "integer");
    EXPECT_EQ(type_name(Value(1.5)), "real");
    EXPECT_EQ(type_name(Value("x")), "string");
    EXPECT_EQ(type_name(Value(ValueList{})), "list");
}

TEST(Value, IntegerAndRealAreDistinct) {
    EXPECT_NE(Value(1), Value(1.0));
    EXPECT_EQ(Value(1).as_number(), Value(1.0).as_number());
}

TEST(Value, NumericList) {
    EXPECT_TRUE(is_numeric_list(Value(Vec2{1, 2})));
    EXPECT_TRUE(is_numeric_list(Value(ValueList{1, 2.5})));
    EXPECT_FALSE(is_numeric_list(Value(ValueList{1, "a"})));
    EXPECT_FALSE(is_numeric_list(Value(4)));
}

TEST(Value, PathBecomesString) {
    Value v(std::filesystem::path("parts/arm.stl"));
    ASSERT_TRUE(v.is_string());
    EXPECT_EQ(v.as_string(), "parts/arm.stl");
}

TEST(Value, Display) {
    EXPECT_EQ(display(Value(ValueList{1, 2, 3})), "[1, 2, 3]");
    EXPECT_EQ(display(Value("text")), "text");
    EXPECT_EQ(display(Value(true)), "true");
}
