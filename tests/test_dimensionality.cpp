#include <vocab/dimensionality.hpp>
#include <vocab/vocabulary.hpp>
#include <common/errors.hpp>
#include <gtest/gtest.h>

using namespace csgir;
using namespace csgir::vocab;
using ir::Dimensionality;

namespace {

// Run a callable and return the message of the exception it throws.
template <typename Error, typename Fn>
std::string message_of(Fn&& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.what();
    }
    ADD_FAILURE() << "Expected an exception";
    return {};
}

}  // namespace

// ============== Classification ==============

TEST(Classify, AllTwoD) {
    ir::Children shapes = {circle(1), square(2)};
    EXPECT_EQ(classify("contain", shapes), Dimensionality::TwoD);
}

TEST(Classify, AllThreeD) {
    ir::Children shapes = {sphere(1), cube({1, 1, 1})};
    EXPECT_EQ(classify("contain", shapes), Dimensionality::ThreeD);
}

TEST(Classify, EmptyIsThreeD) {
    EXPECT_EQ(classify("contain", ir::Children{}), Dimensionality::ThreeD);
}

TEST(Classify, DimensionFreeIgnored) {
    ir::Children shapes = {special("$fn", 12), circle(1), children()};
    EXPECT_EQ(classify("contain", shapes), Dimensionality::TwoD);
}

TEST(Classify, OneOfEachIsGenericMismatch) {
    ir::Children shapes = {circle(1), sphere(2)};
    EXPECT_EQ(message_of<DimensionalityMismatchError>([&] { classify("contain", shapes); }),
              "Cannot contain mixed 2D and 3D expressions.");
}

TEST(Classify, TwoOfEachIsGenericMismatch) {
    ir::Children shapes = {circle(1), sphere(1), circle(2), sphere(2)};
    EXPECT_EQ(message_of<DimensionalityMismatchError>([&] { classify("contain", shapes); }),
              "Cannot contain mixed 2D and 3D expressions.");
}

TEST(Classify, SingleTwoDOutlier) {
    ir::Children shapes = {circle(1), sphere(2), sphere(3)};
    EXPECT_EQ(message_of<DimensionalityMismatchError>([&] { classify("contain", shapes); }),
              "Cannot contain mixed 2D and 3D expressions. One, in place 1 of 3, is 2D.");
}

TEST(Classify, SingleThreeDOutlier) {
    ir::Children shapes = {circle(1), circle(2), sphere(3)};
    EXPECT_EQ(message_of<DimensionalityMismatchError>([&] { classify("contain", shapes); }),
              "Cannot contain mixed 2D and 3D expressions. One, in place 3 of 3, is 3D.");
}

// ============== Arguments ==============

TEST(MatchAgainstArgument, Agreement) {
    ir::Children flat = {circle(1)};
    ir::Children solid = {sphere(1)};
    EXPECT_EQ(match_against_argument("translate", {1, 2}, flat), Dimensionality::TwoD);
    EXPECT_EQ(match_against_argument("translate", {1, 2, 3}, solid), Dimensionality::ThreeD);
}

TEST(MatchAgainstArgument, UnknownDimensionalityCountsAsThreeD) {
    ir::Children none = {children()};
    EXPECT_EQ(match_against_argument("translate", {1, 2, 3}, none), Dimensionality::ThreeD);
    EXPECT_EQ(match_against_argument("translate", {1, 2, 3}, ir::Children{}), Dimensionality::ThreeD);

    std::string message = message_of<DimensionalityMismatchError>(
        [&] { match_against_argument("translate", {1, 2}, none); });
    EXPECT_EQ(message, "Cannot translate 3D OpenSCAD expression with 2D argument [1, 2].");
    EXPECT_THROW(match_against_argument("translate", {1, 2}, ir::Children{}), DimensionalityMismatchError);
}

TEST(MatchAgainstArgument, Mismatch) {
    ir::Children flat = {circle(1)};
    std::string message = message_of<DimensionalityMismatchError>(
        [&] { match_against_argument("translate", {1, 2, 3}, flat); });
    EXPECT_EQ(message, "Cannot translate 2D OpenSCAD expression with 3D argument [1, 2, 3].");
}

TEST(MatchAgainstArgument, PluralMismatch) {
    ir::Children solids = {sphere(1), cube({1, 1, 1})};
    std::string message = message_of<DimensionalityMismatchError>(
        [&] { match_against_argument("scale", {2, 2}, solids); });
    EXPECT_EQ(message, "Cannot scale 3D OpenSCAD expressions with 2D argument [2, 2].");
}

TEST(MatchAgainstArgument, ZeroDimensional) {
    ir::Children flat = {circle(1)};
    EXPECT_THROW(match_against_argument("translate", {1}, flat), DimensionalityZeroError);
    EXPECT_THROW(match_against_argument("translate", {1, 2, 3, 4}, flat), DimensionalityZeroError);
}

// ============== Rejection ==============

TEST(RejectDimensionality, NamesThePlace) {
    ir::Children shapes = {circle(1), sphere(1)};
    EXPECT_EQ(message_of<DimensionalityMismatchError>(
                  [&] { reject_dimensionality("offset", Dimensionality::ThreeD, shapes); }),
              "Cannot offset 3D OpenSCAD expressions. One, in place 2 of 2, is 3D.");
}

TEST(ExpectExpressions, PassesExpressionsThrough) {
    std::vector<Operand> operands = {circle(1), circle(2)};
    EXPECT_EQ(expect_expressions({"contain"}, operands).size(), 2u);
}

TEST(ExpectExpressions, NamesTheOffendingValue) {
    std::vector<Operand> operands = {circle(1), ir::Value(2)};
    EXPECT_EQ(message_of<ExpressionTypeError>([&] {
                  expect_expressions({"contain", "subtract from", "subtract"}, operands);
              }),
              "Cannot subtract non-OpenSCAD expression “2” of type integer.");
}

TEST(QuoteValue, TruncatesLongText) {
    std::string long_text(40, 'x');
    EXPECT_EQ(quote_value(ir::Value(long_text)),
              "“" + std::string(20, 'x') + "...” (truncated) of type string");
    EXPECT_EQ(quote_value(ir::Value("short")), "“short” of type string");
}
