#include <vocab/operators.hpp>
#include <vocab/vocabulary.hpp>
#include <common/errors.hpp>
#include <gtest/gtest.h>
#include <cstdint>
#include <limits>

using namespace csgir;
using namespace csgir::vocab;

namespace {

std::vector<Operand> numbers(std::initializer_list<ir::Value> values) {
    return std::vector<Operand>(values.begin(), values.end());
}

double number(const Operand& result) {
    return std::get<ir::Value>(result).as_number();
}

ir::Value value(const Operand& result) {
    return std::get<ir::Value>(result);
}

}  // namespace

// ============== add ==============

TEST(Add, Scalars) {
    EXPECT_EQ(value(add({})), ir::Value(0));
    EXPECT_EQ(value(add(numbers({-1}))), ir::Value(-1));
    EXPECT_EQ(value(add(numbers({-1, -1}))), ir::Value(-2));
    EXPECT_EQ(value(add(numbers({1, 1, 1, -1}))), ir::Value(2));
    EXPECT_NEAR(number(add(numbers({10, 3.3, 3.3, -0.3}))), 16.3, 1e-9);
}

TEST(Add, IntegersStayIntegral) {
    EXPECT_TRUE(value(add(numbers({1, 2}))).is_integer());
    EXPECT_TRUE(value(add(numbers({1, 2.0}))).is_real());
}

TEST(Add, IntegerOverflowFallsBackToReal) {
    constexpr std::int64_t max = std::numeric_limits<std::int64_t>::max();
    constexpr std::int64_t min = std::numeric_limits<std::int64_t>::min();

    ir::Value sum = value(add(numbers({max, 1})));
    EXPECT_TRUE(sum.is_real());
    EXPECT_DOUBLE_EQ(sum.as_number(), 9223372036854775808.0);

    EXPECT_TRUE(value(sub(numbers({min, 1}))).is_real());
    EXPECT_TRUE(value(mul(numbers({max, 2}))).is_real());

    ir::Value negated = value(sub(numbers({min})));
    EXPECT_TRUE(negated.is_real());
    EXPECT_DOUBLE_EQ(negated.as_number(), 9223372036854775808.0);

    EXPECT_EQ(value(add(numbers({max - 1, 1}))), ir::Value(max));
}

TEST(Add, Vectors) {
    EXPECT_EQ(value(add(numbers({ir::ValueList{1, 2}}))), ir::Value(ir::ValueList{1, 2}));
    EXPECT_EQ(value(add(numbers({ir::ValueList{2, 2}, ir::ValueList{2, 1}, ir::ValueList{0, 2}}))),
              ir::Value(ir::ValueList{4, 5}));
    EXPECT_EQ(value(add(numbers({ir::ValueList{0, 10, 0}, ir::ValueList{2, 1, 0},
                                 ir::ValueList{-1, -1, -1}}))),
              ir::Value(ir::ValueList{1, 10, -1}));
}

TEST(Add, ExpressionsRejected) {
    std::vector<Operand> shapes = {circle(1), circle(2)};
    EXPECT_THROW(add(shapes), OperatorError);
}

// ============== sub ==============

TEST(Sub, Scalars) {
    EXPECT_EQ(value(sub(numbers({1}))), ir::Value(-1));
    EXPECT_EQ(value(sub(numbers({-1}))), ir::Value(1));
    EXPECT_EQ(value(sub(numbers({0, -1}))), ir::Value(1));
    EXPECT_EQ(value(sub(numbers({1, 1, 1}))), ir::Value(-1));
    EXPECT_NEAR(number(sub(numbers({10, 3.3, 3.3, -0.3}))), 3.7, 1e-9);
}

TEST(Sub, Vectors) {
    EXPECT_EQ(value(sub(numbers({ir::ValueList{1, 2}}))), ir::Value(ir::ValueList{-1, -2}));
    EXPECT_EQ(value(sub(numbers({ir::ValueList{2, 2}, ir::ValueList{2, 1}, ir::ValueList{0, 2}}))),
              ir::Value(ir::ValueList{0, -1}));
    EXPECT_EQ(value(sub(numbers({ir::ValueList{0, 10, 0}, ir::ValueList{2, 1, 0},
                                 ir::ValueList{-1, -1, -1}}))),
              ir::Value(ir::ValueList{-1, 10, 1}));
}

TEST(Sub, ExpressionsMakeDifference) {
    std::vector<Operand> shapes = {circle(3), circle(2)};
    Operand result = sub(shapes);
    ASSERT_TRUE(std::holds_alternative<ir::Expression>(result));
    EXPECT_EQ(std::get<ir::Expression>(result), difference({circle(3), circle(2)}));
}

TEST(Sub, NoOperands) {
    EXPECT_THROW(sub({}), OperatorError);
}

TEST(Sub, MixedOperandsNameTheValue) {
    std::vector<Operand> operands = {circle(3), ir::Value("hole")};
    EXPECT_THROW(sub(operands), ExpressionTypeError);
}

// ============== mul ==============

TEST(Mul, Scalars) {
    EXPECT_EQ(value(mul({})), ir::Value(1));
    EXPECT_EQ(value(mul(numbers({-1, -1}))), ir::Value(1));
    EXPECT_EQ(value(mul(numbers({1, 1, 1, -1}))), ir::Value(-1));
    EXPECT_EQ(value(mul(numbers({2, 2}))), ir::Value(4));
}

TEST(Mul, SingleExpressionIsDisabled) {
    std::vector<Operand> shapes = {circle(1)};
    Operand result = mul(shapes);
    ASSERT_TRUE(std::holds_alternative<ir::Expression>(result));
    EXPECT_TRUE(std::get<ir::Expression>(result).holds<ir::Disable2D>());
}

TEST(Mul, SeveralExpressionsRejected) {
    std::vector<Operand> shapes = {circle(1), circle(2)};
    EXPECT_THROW(mul(shapes), OperatorError);
}

// ============== div ==============

TEST(Div, Scalars) {
    EXPECT_DOUBLE_EQ(number(div(numbers({1}))), 1);
    EXPECT_DOUBLE_EQ(number(div(numbers({-1}))), -1);
    EXPECT_DOUBLE_EQ(number(div(numbers({-1, -1}))), 1);
    EXPECT_DOUBLE_EQ(number(div(numbers({0, -1}))), 0);
    EXPECT_DOUBLE_EQ(number(div(numbers({1, 1, 1, -1}))), -1);
    EXPECT_DOUBLE_EQ(number(div(numbers({2, 1}))), 2);
    EXPECT_DOUBLE_EQ(number(div(numbers({1, 4}))), 0.25);
}

TEST(Div, Rejections) {
    EXPECT_THROW(div({}), OperatorError);
    EXPECT_THROW(div(numbers({1, 0})), OperatorError);
    std::vector<Operand> shapes = {circle(1)};
    EXPECT_THROW(div(shapes), OperatorError);
}

// ============== Overloads ==============

TEST(Operators, MinusAndPipe) {
    Expression a = square(4);
    Expression b = circle(1);
    EXPECT_EQ(a - b, difference({a, b}));
    EXPECT_EQ(a | b, union_({a, b}));
}
