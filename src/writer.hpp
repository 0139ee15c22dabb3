#pragma once
#include "expression.hpp"
#include "object_file.hpp"
#include "psyq.hpp"
#include <cstdint>
#include <map>
#include <span>
#include <vector>

namespace psyq {

// Emits LNK records. The buffer starts with the magic header.
class Writer
{
    std::vector<uint8_t> buffer;

    // --- Emitters ---
    void emit(uint8_t byte) { buffer.push_back(byte); }
    void emitOp(Opcode opcode) { emit(static_cast<uint8_t>(opcode)); }
    void emitWord(uint16_t word);
    void emitLong(uint32_t value);
    void emitName(const std::string& name);

public:
    Writer();

    void writeProgramType(uint8_t value);
    void writeSection(const Section& section);
    void writeImport(const ImportedSymbol& symbol);
    void writeExport(const ExportedSymbol& symbol);
    void writeSwitch(uint16_t sectionIndex);
    void writeBytes(std::span<const uint8_t> payload);
    void writeRelocation(RelocationType type, uint16_t rawOffset, const Expression& target);
    void writeExpression(const Expression& expr);
    void writeEnd() { emitOp(Opcode::END); }

    // Any byte, for building streams the parser must reject.
    void writeRaw(uint8_t byte) { emit(byte); }

    size_t position() const { return buffer.size(); }
    const std::vector<uint8_t>& data() const { return buffer; }
};

using SectionPayloads = std::map<uint16_t, std::vector<uint8_t>>;

/**
 * Serialise a model. Sections with a size get a SWITCH + BYTES record, with
 * the payload taken from payloads (zero filled when absent or short),
 * followed by the relocations that fall inside them. Relocations outside
 * every section throw std::invalid_argument.
 */
std::vector<uint8_t> encode(const ObjectFile& object, const SectionPayloads& payloads = {});

} // namespace psyq
