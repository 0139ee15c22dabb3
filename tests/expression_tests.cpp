/**
 * @file expression_tests.cpp
 * @brief Relocation expression model and decoder tests
 */

#include "test_helpers.hpp"
#include "../src/expression.hpp"
#include <gtest/gtest.h>

using psyq::Expression;
using psyq::ExpressionKind;
using psyq::ErrorKind;

class ExpressionDecodeTest : public LnkTestBase {
protected:
    // Decode one expression from the bytes that follow the header.
    Expression decode(const std::vector<uint8_t>& body) {
        bytes = magic();
        bytes.insert(bytes.end(), body.begin(), body.end());
        psyq::Parser parser(bytes, diagnostics, options);
        parser.seek(TestConstants::HEADER_SIZE);
        auto expr = parser.parseExpression();
        consumed = parser.position() - TestConstants::HEADER_SIZE;
        return expr;
    }

    std::vector<uint8_t> bytes;
    size_t consumed = 0;
};

// ============================================================================
// Model
// ============================================================================

TEST(ExpressionTests, FactoriesSetKindAndPayload) {
    auto value = Expression::Value(-4);
    EXPECT_EQ(value.kind, ExpressionKind::Value);
    EXPECT_EQ(value.value, -4);
    EXPECT_FALSE(value.is_operator());

    auto base = Expression::SectionBase(3);
    EXPECT_EQ(base.kind, ExpressionKind::SectionBase);
    EXPECT_EQ(base.index, 3);
    EXPECT_TRUE(base.references_section());

    auto sum = Expression::Add(Expression::Symbol(1), Expression::Value(8));
    EXPECT_TRUE(sum.is_operator());
    ASSERT_NE(sum.left, nullptr);
    ASSERT_NE(sum.right, nullptr);
    EXPECT_EQ(sum.left->kind, ExpressionKind::Symbol);
    EXPECT_EQ(sum.right->value, 8);
}

TEST(ExpressionTests, EqualityIsDeep) {
    auto a = Expression::Sub(Expression::SectionEnd(2), Expression::SectionStart(2));
    auto b = Expression::Sub(Expression::SectionEnd(2), Expression::SectionStart(2));
    auto c = Expression::Sub(Expression::SectionEnd(2), Expression::SectionStart(3));
    auto d = Expression::Add(Expression::SectionEnd(2), Expression::SectionStart(2));

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_NE(a, d);
    EXPECT_NE(Expression::Symbol(1), Expression::SectionBase(1)) << "Same index, different kind";
}

TEST(ExpressionTests, CopyIsIndependent) {
    auto original = Expression::Add(Expression::SectionBase(1), Expression::Value(0x10));
    auto copy = original.clone();
    EXPECT_EQ(copy, original);

    copy.right->value = 0x20;
    EXPECT_NE(copy, original);
    EXPECT_EQ(original.right->value, 0x10);
}

TEST(ExpressionTests, ToString) {
    EXPECT_EQ(Expression::Value(0x10).to_string(), "$10");
    EXPECT_EQ(Expression::Symbol(7).to_string(), "sym(7)");
    EXPECT_EQ(Expression::Add(Expression::SectionBase(1), Expression::Value(0x10)).to_string(),
              "(sectbase(1) + $10)");
    EXPECT_EQ(Expression::Div(Expression::Sub(Expression::SectionEnd(2), Expression::SectionStart(2)),
                              Expression::Value(4)).to_string(),
              "((sectend(2) - sectstart(2)) / $4)");
}

TEST(ExpressionTests, SectionReferencesInOrder) {
    auto expr = Expression::Add(Expression::Sub(Expression::SectionEnd(2), Expression::Symbol(9)),
                                Expression::SectionBase(5));
    EXPECT_EQ(expr.section_references(), (std::vector<uint16_t>{2, 5}));
    EXPECT_TRUE(Expression::Value(1).section_references().empty());
}

// ============================================================================
// Decoding
// ============================================================================

TEST_F(ExpressionDecodeTest, Value) {
    auto expr = decode({0x00, 0x78, 0x56, 0x34, 0x12});
    EXPECT_EQ(expr, Expression::Value(0x12345678));
    EXPECT_EQ(consumed, 5u);
}

TEST_F(ExpressionDecodeTest, NegativeValue) {
    auto expr = decode({0x00, 0xFC, 0xFF, 0xFF, 0xFF});
    EXPECT_EQ(expr.value, -4);
}

TEST_F(ExpressionDecodeTest, IndexLeaves) {
    EXPECT_EQ(decode({2, 0x03, 0x00}), Expression::Symbol(3));
    EXPECT_EQ(decode({4, 0x01, 0x02}), Expression::SectionBase(0x0201));
    EXPECT_EQ(decode({12, 0x05, 0x00}), Expression::SectionStart(5));
    EXPECT_EQ(decode({22, 0x05, 0x00}), Expression::SectionEnd(5));
    EXPECT_EQ(consumed, 3u);
}

TEST_F(ExpressionDecodeTest, OperatorTakesLeftThenRight) {
    // SUB sectend(1) sectstart(1)
    auto expr = decode({46, 22, 0x01, 0x00, 12, 0x01, 0x00});
    EXPECT_EQ(expr, Expression::Sub(Expression::SectionEnd(1), Expression::SectionStart(1)));
    EXPECT_EQ(consumed, 7u);
}

TEST_F(ExpressionDecodeTest, NestedOperators) {
    // ADD (DIV value(8) value(2)) sym(4)
    auto expr = decode({44,
                        50, 0, 8, 0, 0, 0, 0, 2, 0, 0, 0,
                        2, 4, 0});
    auto expected = Expression::Add(Expression::Div(Expression::Value(8), Expression::Value(2)),
                                    Expression::Symbol(4));
    EXPECT_EQ(expr, expected);
    EXPECT_EQ(consumed, 15u);
}

TEST_F(ExpressionDecodeTest, UnknownOpcodeFails) {
    expectParseError([&] { decode({0x07, 0, 0}); }, ErrorKind::UnknownExpressionOpcode, 4);
}

TEST_F(ExpressionDecodeTest, UnknownOpcodeInsideOperator) {
    expectParseError([&] { decode({44, 2, 1, 0, 0x09}); }, ErrorKind::UnknownExpressionOpcode, 8);
}

TEST_F(ExpressionDecodeTest, MissingOperandIsTruncated) {
    expectParseError([&] { decode({44, 2, 1, 0}); }, ErrorKind::TruncatedInput, 8);
}

TEST_F(ExpressionDecodeTest, TruncatedImmediate) {
    expectParseError([&] { decode({0x00, 1, 2}); }, ErrorKind::TruncatedInput, 5);
}

TEST_F(ExpressionDecodeTest, DepthLimit) {
    options.maxExpressionDepth = 2;

    // two operator levels: leaves sit at depth 2
    EXPECT_NO_THROW(decode({44, 44, 2, 1, 0, 2, 2, 0, 2, 3, 0}));

    // three operator levels: leaves at depth 3
    expectParseError([&] { decode({44, 44, 44, 2, 1, 0, 2, 2, 0, 2, 3, 0, 2, 4, 0}); },
                     ErrorKind::MalformedExpression, 7);
}

TEST_F(ExpressionDecodeTest, HostileNestingDoesNotOverflow) {
    std::vector<uint8_t> body(100000, 44);
    EXPECT_THROW(decode(body), psyq::ParseError);
}
