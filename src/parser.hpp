#pragma once
#include "byte_cursor.hpp"
#include "diagnostics.hpp"
#include "expression.hpp"
#include "object_file.hpp"
#include <cstdint>
#include <optional>
#include <span>

namespace psyq {

struct ParseOptions {
    // Operator nesting allowed in a relocation expression before the input
    // is rejected as MalformedExpression.
    size_t maxExpressionDepth = 64;
    bool warnOnUnknownProgramType = true;
};

// State owned by a single parse: the model being built and the section
// selected by the last SWITCH record.
struct ParseContext {
    ObjectFile object;
    std::optional<uint16_t> currentSection;

    // Throws NoCurrentSection if no SWITCH was seen or it named a section
    // that does not exist. recordOffset is reported as the error location.
    Section& currentSectionRef(size_t recordOffset);
};

// True when the buffer starts with the exact bytes "LNK\x02".
bool is_valid_for_data(std::span<const uint8_t> data) noexcept;

class Parser
{
    std::span<const uint8_t> input;
    ByteCursor cursor;
    DiagnosticSink& diagnostics;
    ParseOptions options;

    // Reads one opcode and runs its decoder. Returns false on END.
    bool dispatch(ParseContext& ctx);

    void parseSection(ParseContext& ctx);
    void parseImportedSymbol(ParseContext& ctx);
    void parseExportedSymbol(ParseContext& ctx);
    void parseSwitch(ParseContext& ctx);
    void parseBytes(ParseContext& ctx, size_t recordOffset);
    void parseRelocation(ParseContext& ctx, size_t recordOffset);
    void parseProgramType(ParseContext& ctx);

    Expression parseExpression(size_t depth);

public:
    Parser(std::span<const uint8_t> data, DiagnosticSink& sink, ParseOptions opts = {})
        : input(data), cursor(data), diagnostics(sink), options(opts) {}

    /**
     * Decode the whole buffer. Stops at END or at the end of input.
     * Throws ParseError on the first malformed record; nothing partial is
     * returned. Can be called again and starts over from the header.
     */
    ObjectFile parse();

    // Decode one relocation target expression at the current position.
    Expression parseExpression() { return parseExpression(0); }

    // Where the cursor is; after a failed parse this is where decoding stopped.
    size_t position() const { return cursor.position(); }
    void seek(size_t offset) { cursor.seek(offset); }
};

ObjectFile parse(std::span<const uint8_t> data, DiagnosticSink& diagnostics, ParseOptions options = {});

} // namespace psyq
