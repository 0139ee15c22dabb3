#include "writer.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace psyq {

Writer::Writer()
{
    buffer.assign(std::begin(MAGIC_NUMBER), std::end(MAGIC_NUMBER));
}

void Writer::emitWord(uint16_t word)
{
    emit(static_cast<uint8_t>(word & 0x00FF));
    emit(static_cast<uint8_t>((word & 0xFF00) >> 8));
}

void Writer::emitLong(uint32_t value)
{
    emitWord(static_cast<uint16_t>(value & 0xFFFF));
    emitWord(static_cast<uint16_t>(value >> 16));
}

void Writer::emitName(const std::string& name)
{
    if (!fits_name_length(name.size())) {
        throw std::length_error("Name too long for LNK record: " + name);
    }
    emit(static_cast<uint8_t>(name.size()));
    buffer.insert(buffer.end(), name.begin(), name.end());
}

void Writer::writeProgramType(uint8_t value)
{
    emitOp(Opcode::PROGRAMTYPE);
    emit(value);
}

void Writer::writeSection(const Section& section)
{
    emitOp(Opcode::SECTION);
    emitWord(section.index);
    emitWord(section.group);
    emit(section.alignment);
    emitName(section.name);
}

void Writer::writeImport(const ImportedSymbol& symbol)
{
    emitOp(Opcode::IMPORTED_SYMBOL);
    emitWord(symbol.index);
    emitName(symbol.name);
}

void Writer::writeExport(const ExportedSymbol& symbol)
{
    emitOp(Opcode::EXPORTED_SYMBOL);
    emitWord(symbol.index);
    emitWord(symbol.sectionIndex);
    emitLong(symbol.offset);
    emitName(symbol.name);
}

void Writer::writeSwitch(uint16_t sectionIndex)
{
    emitOp(Opcode::SWITCH);
    emitWord(sectionIndex);
}

void Writer::writeBytes(std::span<const uint8_t> payload)
{
    if (payload.size() > 0xFFFF) {
        throw std::length_error("BYTES payload of " + std::to_string(payload.size()) + " bytes exceeds 65535");
    }
    emitOp(Opcode::BYTES);
    emitWord(static_cast<uint16_t>(payload.size()));
    buffer.insert(buffer.end(), payload.begin(), payload.end());
}

void Writer::writeRelocation(RelocationType type, uint16_t rawOffset, const Expression& target)
{
    emitOp(Opcode::RELOCATION);
    emit(static_cast<uint8_t>(type));
    emitWord(rawOffset);
    writeExpression(target);
}

void Writer::writeExpression(const Expression& expr)
{
    emit(static_cast<uint8_t>(opcode_of(expr.kind)));
    switch (expr.kind) {
        case ExpressionKind::Value:
            emitLong(static_cast<uint32_t>(expr.value));
            break;
        case ExpressionKind::Symbol:
        case ExpressionKind::SectionBase:
        case ExpressionKind::SectionStart:
        case ExpressionKind::SectionEnd:
            emitWord(expr.index);
            break;
        case ExpressionKind::Add:
        case ExpressionKind::Sub:
        case ExpressionKind::Div:
            if (!expr.left || !expr.right) {
                throw std::invalid_argument("Operator expression is missing an operand");
            }
            writeExpression(*expr.left);
            writeExpression(*expr.right);
            break;
    }
}

std::vector<uint8_t> encode(const ObjectFile& object, const SectionPayloads& payloads)
{
    Writer writer;

    if (auto type = object.programType()) {
        writer.writeProgramType(*type);
    }
    for (const auto& [index, section] : object.sections()) {
        writer.writeSection(section);
    }
    for (const auto& symbol : object.imports()) {
        writer.writeImport(symbol);
    }
    for (const auto& symbol : object.exports()) {
        writer.writeExport(symbol);
    }

    std::vector<bool> placed(object.relocations().size(), false);

    for (const auto& [index, section] : object.sections()) {
        if (section.size == 0) continue;

        std::vector<uint8_t> payload(section.size, 0);
        if (auto it = payloads.find(index); it != payloads.end()) {
            std::copy_n(it->second.begin(), std::min(it->second.size(), payload.size()), payload.begin());
        }

        writer.writeSwitch(index);
        writer.writeBytes(payload);

        const auto& relocs = object.relocations();
        for (size_t i = 0; i < relocs.size(); ++i) {
            const auto& reloc = relocs[i];
            if (placed[i]) continue;
            if (reloc.offset < section.offset || reloc.offset >= section.offset + section.size) continue;

            writer.writeRelocation(reloc.type, static_cast<uint16_t>(reloc.offset - section.offset), reloc.target);
            placed[i] = true;
        }
    }

    for (size_t i = 0; i < placed.size(); ++i) {
        if (!placed[i]) {
            throw std::invalid_argument("Relocation at offset " + std::to_string(object.relocations()[i].offset) +
                                        " is outside every section");
        }
    }

    writer.writeEnd();
    return writer.data();
}

} // namespace psyq
