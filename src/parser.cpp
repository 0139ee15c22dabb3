#include "parser.hpp"
#include "errors.hpp"
#include <algorithm>
#include <string>

namespace psyq {

Section& ParseContext::currentSectionRef(size_t recordOffset)
{
    if (!currentSection) {
        throw ParseError(ErrorKind::NoCurrentSection, recordOffset, "record needs a section but no SWITCH came before it");
    }
    auto* section = object.findSection(*currentSection);
    if (!section) {
        throw ParseError(ErrorKind::NoCurrentSection, recordOffset,
                         "current section " + std::to_string(*currentSection) + " was never defined");
    }
    return *section;
}

bool is_valid_for_data(std::span<const uint8_t> data) noexcept
{
    if (data.size() < HEADER_SIZE) return false;
    return std::equal(std::begin(MAGIC_NUMBER), std::end(MAGIC_NUMBER), data.begin());
}

ObjectFile Parser::parse()
{
    cursor.seek(0);
    if (!is_valid_for_data(input)) {
        throw ParseError(ErrorKind::BadMagic, 0, "input does not start with LNK\\x02");
    }
    cursor.skip(HEADER_SIZE);

    ParseContext ctx;
    while (!cursor.is_eof()) {
        if (!dispatch(ctx)) break;
    }
    return std::move(ctx.object);
}

bool Parser::dispatch(ParseContext& ctx)
{
    const size_t recordOffset = cursor.position();
    const uint8_t opcode = cursor.read_u8();

    auto kind = record_kind(opcode);
    if (!kind) {
        // leave the cursor on the opcode so callers can report it
        cursor.seek(recordOffset);
        auto name = opcode_name(opcode);
        if (name.empty()) {
            throw ParseError(ErrorKind::UnknownOpcode, recordOffset, "opcode " + std::to_string(opcode));
        }
        throw ParseError(ErrorKind::UnknownOpcode, recordOffset,
                         "unsupported record " + std::string(name) + " (" + std::to_string(opcode) + ")");
    }

    switch (*kind) {
        case RecordKind::End:
            return false;
        case RecordKind::Section:
            parseSection(ctx);
            break;
        case RecordKind::ImportedSymbol:
            parseImportedSymbol(ctx);
            break;
        case RecordKind::ExportedSymbol:
            parseExportedSymbol(ctx);
            break;
        case RecordKind::Switch:
            parseSwitch(ctx);
            break;
        case RecordKind::Bytes:
            parseBytes(ctx, recordOffset);
            break;
        case RecordKind::Relocation:
            parseRelocation(ctx, recordOffset);
            break;
        case RecordKind::ProgramType:
            parseProgramType(ctx);
            break;
    }
    return true;
}

void Parser::parseSection(ParseContext& ctx)
{
    Section section;
    section.index = cursor.read_u16_le();
    section.group = cursor.read_u16_le();
    section.alignment = cursor.read_u8();
    section.name = cursor.read_length_prefixed_bytes();
    ctx.object.addSection(std::move(section));
}

void Parser::parseImportedSymbol(ParseContext& ctx)
{
    ImportedSymbol symbol;
    symbol.index = cursor.read_u16_le();
    symbol.name = cursor.read_length_prefixed_bytes();
    ctx.object.addImport(std::move(symbol));
}

void Parser::parseExportedSymbol(ParseContext& ctx)
{
    ExportedSymbol symbol;
    symbol.index = cursor.read_u16_le();
    symbol.sectionIndex = cursor.read_u16_le();
    symbol.offset = cursor.read_u32_le();
    symbol.name = cursor.read_length_prefixed_bytes();
    ctx.object.addExport(std::move(symbol));
}

void Parser::parseSwitch(ParseContext& ctx)
{
    ctx.currentSection = cursor.read_u16_le();
}

void Parser::parseBytes(ParseContext& ctx, size_t recordOffset)
{
    const uint16_t size = cursor.read_u16_le();
    Section& section = ctx.currentSectionRef(recordOffset);

    // only the span is kept; consumers re-read the payload from the buffer
    section.offset = static_cast<uint32_t>(cursor.position());
    section.size = size;
    cursor.skip(size);
}

void Parser::parseRelocation(ParseContext& ctx, size_t recordOffset)
{
    const size_t typeOffset = cursor.position();
    const uint8_t typeByte = cursor.read_u8();
    auto type = relocation_type(typeByte);
    if (!type) {
        cursor.seek(typeOffset);
        throw ParseError(ErrorKind::UnknownRelocationType, typeOffset,
                         "relocation type " + std::to_string(typeByte));
    }

    const uint16_t rawOffset = cursor.read_u16_le();
    const Section& section = ctx.currentSectionRef(recordOffset);

    Relocation reloc;
    reloc.type = *type;
    reloc.offset = section.offset + rawOffset;
    reloc.target = parseExpression(0);
    ctx.object.addRelocation(std::move(reloc));
}

void Parser::parseProgramType(ParseContext& ctx)
{
    const uint8_t value = cursor.read_u8();
    if (!is_known_program_type(value) && options.warnOnUnknownProgramType) {
        diagnostics.warn("Unknown program type: " + std::to_string(value));
    }
    ctx.object.setProgramType(value);
}

Expression Parser::parseExpression(size_t depth)
{
    const size_t start = cursor.position();
    if (depth > options.maxExpressionDepth) {
        throw ParseError(ErrorKind::MalformedExpression, start,
                         "expression nested deeper than " + std::to_string(options.maxExpressionDepth));
    }

    const uint8_t opcode = cursor.read_u8();
    auto kind = expression_kind(opcode);
    if (!kind) {
        cursor.seek(start);
        throw ParseError(ErrorKind::UnknownExpressionOpcode, start, "expression opcode " + std::to_string(opcode));
    }

    switch (*kind) {
        case ExpressionKind::Value:
            return Expression::Value(static_cast<int32_t>(cursor.read_u32_le()));
        case ExpressionKind::Symbol:
            return Expression::Symbol(cursor.read_u16_le());
        case ExpressionKind::SectionBase:
            return Expression::SectionBase(cursor.read_u16_le());
        case ExpressionKind::SectionStart:
            return Expression::SectionStart(cursor.read_u16_le());
        case ExpressionKind::SectionEnd:
            return Expression::SectionEnd(cursor.read_u16_le());
        case ExpressionKind::Add:
        case ExpressionKind::Sub:
        case ExpressionKind::Div: {
            // operands follow the operator, left first
            auto left = parseExpression(depth + 1);
            auto right = parseExpression(depth + 1);
            if (*kind == ExpressionKind::Add) return Expression::Add(std::move(left), std::move(right));
            if (*kind == ExpressionKind::Sub) return Expression::Sub(std::move(left), std::move(right));
            return Expression::Div(std::move(left), std::move(right));
        }
    }
    throw ParseError(ErrorKind::UnknownExpressionOpcode, start, "expression opcode " + std::to_string(opcode));
}

ObjectFile parse(std::span<const uint8_t> data, DiagnosticSink& diagnostics, ParseOptions options)
{
    Parser parser(data, diagnostics, options);
    return parser.parse();
}

} // namespace psyq
