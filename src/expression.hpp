#pragma once
#include "psyq.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace psyq {

enum class ExpressionKind
{
    Value,
    Symbol,
    SectionBase,
    SectionStart,
    SectionEnd,
    Add,
    Sub,
    Div,
};

std::optional<ExpressionKind> expression_kind(uint8_t opcode) noexcept;
ExpressionOpcode opcode_of(ExpressionKind kind) noexcept;

// Target of a relocation. Leaves hold either a constant (value) or a symbol
// or section index (index); operators own both operands.
struct Expression
{
    ExpressionKind kind = ExpressionKind::Value;
    int32_t value = 0;
    uint16_t index = 0;
    std::unique_ptr<Expression> left;
    std::unique_ptr<Expression> right;

    Expression() = default;
    Expression(const Expression& other);
    Expression(Expression&&) noexcept = default;
    Expression& operator=(const Expression& other);
    Expression& operator=(Expression&&) noexcept = default;

    static Expression Value(int32_t value);
    static Expression Symbol(uint16_t index);
    static Expression SectionBase(uint16_t section);
    static Expression SectionStart(uint16_t section);
    static Expression SectionEnd(uint16_t section);
    static Expression Add(Expression left, Expression right);
    static Expression Sub(Expression left, Expression right);
    static Expression Div(Expression left, Expression right);

    bool is_operator() const noexcept;
    bool references_section() const noexcept;

    Expression clone() const { return *this; }

    // Section indices named by SectionBase/Start/End leaves, left to right.
    std::vector<uint16_t> section_references() const;

    // e.g. "(sectbase(1) + $10)"
    std::string to_string() const;

    bool operator==(const Expression& other) const;
    bool operator!=(const Expression& other) const { return !(*this == other); }

private:
    static Expression binary(ExpressionKind kind, Expression left, Expression right);
    static Expression leaf(ExpressionKind kind, uint16_t index);
};

} // namespace psyq
