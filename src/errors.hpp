#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace psyq {

enum class ErrorKind
{
    BadMagic,
    TruncatedInput,
    UnknownOpcode,
    UnknownRelocationType,
    UnknownExpressionOpcode,
    MalformedExpression,
    NoCurrentSection,
    InvalidSectionReference,
};

std::string_view to_string(ErrorKind kind) noexcept;

// Every decoding failure. The offset is the position of the byte that could
// not be decoded, or of the record that referenced something missing.
class ParseError : public std::runtime_error
{
    ErrorKind errorKind;
    size_t errorOffset;

public:
    ParseError(ErrorKind kind, size_t offset, const std::string& detail);

    ErrorKind kind() const noexcept { return errorKind; }
    size_t offset() const noexcept { return errorOffset; }
};

} // namespace psyq
