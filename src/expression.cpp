#include "expression.hpp"
#include <iomanip>
#include <sstream>

namespace psyq {

std::optional<ExpressionKind> expression_kind(uint8_t opcode) noexcept
{
    switch (static_cast<ExpressionOpcode>(opcode)) {
        case ExpressionOpcode::VALUE:         return ExpressionKind::Value;
        case ExpressionOpcode::SYMBOL:        return ExpressionKind::Symbol;
        case ExpressionOpcode::SECTION_BASE:  return ExpressionKind::SectionBase;
        case ExpressionOpcode::SECTION_START: return ExpressionKind::SectionStart;
        case ExpressionOpcode::SECTION_END:   return ExpressionKind::SectionEnd;
        case ExpressionOpcode::ADD:           return ExpressionKind::Add;
        case ExpressionOpcode::SUB:           return ExpressionKind::Sub;
        case ExpressionOpcode::DIV:           return ExpressionKind::Div;
        default:                              return std::nullopt;
    }
}

ExpressionOpcode opcode_of(ExpressionKind kind) noexcept
{
    switch (kind) {
        case ExpressionKind::Value:        return ExpressionOpcode::VALUE;
        case ExpressionKind::Symbol:       return ExpressionOpcode::SYMBOL;
        case ExpressionKind::SectionBase:  return ExpressionOpcode::SECTION_BASE;
        case ExpressionKind::SectionStart: return ExpressionOpcode::SECTION_START;
        case ExpressionKind::SectionEnd:   return ExpressionOpcode::SECTION_END;
        case ExpressionKind::Add:          return ExpressionOpcode::ADD;
        case ExpressionKind::Sub:          return ExpressionOpcode::SUB;
        case ExpressionKind::Div:          return ExpressionOpcode::DIV;
    }
    return ExpressionOpcode::VALUE;
}

Expression::Expression(const Expression& other)
    : kind(other.kind),
      value(other.value),
      index(other.index),
      left(other.left ? std::make_unique<Expression>(*other.left) : nullptr),
      right(other.right ? std::make_unique<Expression>(*other.right) : nullptr)
{
}

Expression& Expression::operator=(const Expression& other)
{
    if (this != &other) {
        Expression copy(other);
        *this = std::move(copy);
    }
    return *this;
}

Expression Expression::leaf(ExpressionKind kind, uint16_t index)
{
    Expression expr;
    expr.kind = kind;
    expr.index = index;
    return expr;
}

Expression Expression::binary(ExpressionKind kind, Expression left, Expression right)
{
    Expression expr;
    expr.kind = kind;
    expr.left = std::make_unique<Expression>(std::move(left));
    expr.right = std::make_unique<Expression>(std::move(right));
    return expr;
}

Expression Expression::Value(int32_t value)
{
    Expression expr;
    expr.kind = ExpressionKind::Value;
    expr.value = value;
    return expr;
}

Expression Expression::Symbol(uint16_t index) { return leaf(ExpressionKind::Symbol, index); }
Expression Expression::SectionBase(uint16_t section) { return leaf(ExpressionKind::SectionBase, section); }
Expression Expression::SectionStart(uint16_t section) { return leaf(ExpressionKind::SectionStart, section); }
Expression Expression::SectionEnd(uint16_t section) { return leaf(ExpressionKind::SectionEnd, section); }

Expression Expression::Add(Expression left, Expression right)
{
    return binary(ExpressionKind::Add, std::move(left), std::move(right));
}

Expression Expression::Sub(Expression left, Expression right)
{
    return binary(ExpressionKind::Sub, std::move(left), std::move(right));
}

Expression Expression::Div(Expression left, Expression right)
{
    return binary(ExpressionKind::Div, std::move(left), std::move(right));
}

bool Expression::is_operator() const noexcept
{
    return kind == ExpressionKind::Add || kind == ExpressionKind::Sub || kind == ExpressionKind::Div;
}

bool Expression::references_section() const noexcept
{
    return kind == ExpressionKind::SectionBase ||
           kind == ExpressionKind::SectionStart ||
           kind == ExpressionKind::SectionEnd;
}

std::vector<uint16_t> Expression::section_references() const
{
    std::vector<uint16_t> sections;
    if (references_section()) {
        sections.push_back(index);
    } else if (is_operator()) {
        for (const auto* operand : {left.get(), right.get()}) {
            if (!operand) continue;
            auto nested = operand->section_references();
            sections.insert(sections.end(), nested.begin(), nested.end());
        }
    }
    return sections;
}

std::string Expression::to_string() const
{
    std::ostringstream oss;
    switch (kind) {
        case ExpressionKind::Value:
            oss << "$" << std::hex << static_cast<uint32_t>(value);
            break;
        case ExpressionKind::Symbol:
            oss << "sym(" << index << ")";
            break;
        case ExpressionKind::SectionBase:
            oss << "sectbase(" << index << ")";
            break;
        case ExpressionKind::SectionStart:
            oss << "sectstart(" << index << ")";
            break;
        case ExpressionKind::SectionEnd:
            oss << "sectend(" << index << ")";
            break;
        case ExpressionKind::Add:
        case ExpressionKind::Sub:
        case ExpressionKind::Div: {
            const char* op = kind == ExpressionKind::Add ? " + " : kind == ExpressionKind::Sub ? " - " : " / ";
            oss << "(" << (left ? left->to_string() : "?") << op << (right ? right->to_string() : "?") << ")";
            break;
        }
    }
    return oss.str();
}

bool Expression::operator==(const Expression& other) const
{
    if (kind != other.kind) return false;

    switch (kind) {
        case ExpressionKind::Value:
            return value == other.value;
        case ExpressionKind::Symbol:
        case ExpressionKind::SectionBase:
        case ExpressionKind::SectionStart:
        case ExpressionKind::SectionEnd:
            return index == other.index;
        case ExpressionKind::Add:
        case ExpressionKind::Sub:
        case ExpressionKind::Div:
            break;
    }

    auto same = [](const std::unique_ptr<Expression>& a, const std::unique_ptr<Expression>& b) {
        if (!a || !b) return a == b;
        return *a == *b;
    };
    return same(left, other.left) && same(right, other.right);
}

} // namespace psyq
