#include "errors.hpp"

namespace psyq {

std::string_view to_string(ErrorKind kind) noexcept
{
    switch (kind) {
        case ErrorKind::BadMagic:                return "BadMagic";
        case ErrorKind::TruncatedInput:          return "TruncatedInput";
        case ErrorKind::UnknownOpcode:           return "UnknownOpcode";
        case ErrorKind::UnknownRelocationType:   return "UnknownRelocationType";
        case ErrorKind::UnknownExpressionOpcode: return "UnknownExpressionOpcode";
        case ErrorKind::MalformedExpression:     return "MalformedExpression";
        case ErrorKind::NoCurrentSection:        return "NoCurrentSection";
        case ErrorKind::InvalidSectionReference: return "InvalidSectionReference";
    }
    return "Unknown";
}

ParseError::ParseError(ErrorKind kind, size_t offset, const std::string& detail)
    : std::runtime_error(std::string(to_string(kind)) + " at offset " + std::to_string(offset) + ": " + detail),
      errorKind(kind),
      errorOffset(offset)
{
}

} // namespace psyq
