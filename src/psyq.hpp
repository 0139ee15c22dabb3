/**
 * @file psyq.hpp
 * @brief Constants and enumerations of the PSY-Q LNK object format
 *
 * The LNK format is the object file written by the PSY-Q assembler (ASMPSX)
 * and C compiler driver (CCPSX) for the PlayStation. A file is a 4 byte
 * header followed by a stream of records, each introduced by a single
 * opcode byte. Record payloads have no common length prefix, so a reader
 * must know the layout of every record it meets.
 *
 * Values below match the ones used by the PSY-Q DUMPOBJ utility and the
 * psyq-obj-parser tool shipped with PCSX-Redux.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string_view>

// =============================================================================
// CRITICAL: BYTE ORDERING
// =============================================================================

/**
 * @brief BYTE ORDER: ALL MULTI-BYTE VALUES ARE LITTLE-ENDIAN
 *
 * This applies to every record field (indices, offsets, sizes) and to the
 * immediates carried by relocation expressions.
 *
 * Example: The value 0x1234 is stored as bytes [0x34, 0x12]
 */

namespace psyq {

// =============================================================================
// FILE IDENTIFICATION
// =============================================================================

/**
 * @brief Magic number at offset 0 of every LNK file: "LNK" followed by the
 * format version byte 2
 */
constexpr uint8_t MAGIC_NUMBER[4] = {0x4C, 0x4E, 0x4B, 0x02};

constexpr size_t HEADER_SIZE = sizeof(MAGIC_NUMBER);

// =============================================================================
// RECORD OPCODES
// =============================================================================

/**
 * @brief Every record opcode known to the PSY-Q toolchain
 *
 * Only a subset is decoded by this library (see RecordKind). The rest are
 * listed so that a stream containing them can be reported by name instead of
 * as an anonymous byte.
 */
enum class Opcode : uint8_t {
    END                     = 0,   ///< End of object
    BYTES                   = 2,   ///< Raw bytes for the current section
    SWITCH                  = 6,   ///< Select the current section
    ZEROES                  = 8,   ///< Run of zero bytes
    RELOCATION              = 10,  ///< Patch with a computed expression
    EXPORTED_SYMBOL         = 12,  ///< XDEF
    IMPORTED_SYMBOL         = 14,  ///< XREF
    SECTION                 = 16,  ///< Section symbol definition
    LOCAL_SYMBOL            = 18,  ///< Local symbol
    FILENAME                = 28,  ///< Source file name
    PROGRAMTYPE             = 46,  ///< Target CPU / program type
    UNINITIALIZED           = 48,  ///< BSS-style uninitialised symbol
    INC_SLD_LINENUM         = 50,  ///< Source line debug: increment by 1
    INC_SLD_LINENUM_BY_BYTE = 52,  ///< Source line debug: increment by byte
    INC_SLD_LINENUM_BY_WORD = 54,  ///< Source line debug: increment by word
    SET_SLD_LINENUM         = 56,  ///< Source line debug: set line
    SET_SLD_LINENUM_FILE    = 58,  ///< Source line debug: set line and file
    END_SLD                 = 60,  ///< Source line debug: end
    FUNCTION                = 74,  ///< Function start debug info
    FUNCTION_END            = 76,  ///< Function end debug info
    BLOCK_START             = 78,  ///< Block start debug info
    BLOCK_END               = 80,  ///< Block end debug info
    SECTION_DEF             = 82,  ///< Symbol definition debug info
    SECTION_DEF2            = 84,  ///< Extended symbol definition debug info
    FUNCTION_START2         = 86   ///< Extended function start debug info
};

/**
 * @brief Records this decoder understands
 *
 * Closed set: the dispatcher switches over it without a default arm so a new
 * kind cannot be added without a decoder for it.
 */
enum class RecordKind : uint8_t {
    End,
    Bytes,
    Switch,
    Relocation,
    ExportedSymbol,
    ImportedSymbol,
    Section,
    ProgramType
};

constexpr std::optional<RecordKind> record_kind(uint8_t opcode) noexcept {
    switch (static_cast<Opcode>(opcode)) {
        case Opcode::END:             return RecordKind::End;
        case Opcode::BYTES:           return RecordKind::Bytes;
        case Opcode::SWITCH:          return RecordKind::Switch;
        case Opcode::RELOCATION:      return RecordKind::Relocation;
        case Opcode::EXPORTED_SYMBOL: return RecordKind::ExportedSymbol;
        case Opcode::IMPORTED_SYMBOL: return RecordKind::ImportedSymbol;
        case Opcode::SECTION:         return RecordKind::Section;
        case Opcode::PROGRAMTYPE:     return RecordKind::ProgramType;
        default:                      return std::nullopt;
    }
}

/**
 * @brief Name of a documented opcode, or an empty view for unknown values
 */
std::string_view opcode_name(uint8_t opcode) noexcept;

// =============================================================================
// PROGRAM TYPES
// =============================================================================

/**
 * @brief Values seen in the PROGRAMTYPE record
 *
 * 7 is emitted for R3000 objects, 9 by the later toolchains. Anything else
 * is kept verbatim but flagged with a warning.
 */
enum class ProgramType : uint8_t {
    MIPS_R3000 = 7,
    MIPS_R3000_V2 = 9
};

constexpr bool is_known_program_type(uint8_t value) noexcept {
    return value == static_cast<uint8_t>(ProgramType::MIPS_R3000) ||
           value == static_cast<uint8_t>(ProgramType::MIPS_R3000_V2);
}

// =============================================================================
// RELOCATION TYPES
// =============================================================================

/**
 * @brief Patch kinds carried by a RELOCATION record
 *
 * The _BE variants describe the same patch on a big-endian target and are
 * never produced for the PlayStation, but the toolchain defines them.
 */
enum class RelocationType : uint8_t {
    REL32_BE = 8,    ///< 32-bit word, big-endian
    REL32    = 16,   ///< 32-bit word
    REL26    = 74,   ///< 26-bit jump target (J/JAL)
    HI16     = 82,   ///< Upper 16 bits (LUI)
    LO16     = 84,   ///< Lower 16 bits (ADDIU, loads, stores)
    REL26_BE = 92,   ///< 26-bit jump target, big-endian
    HI16_BE  = 96,   ///< Upper 16 bits, big-endian
    LO16_BE  = 98,   ///< Lower 16 bits, big-endian
    GPREL16  = 100   ///< 16-bit offset from $gp
};

constexpr std::optional<RelocationType> relocation_type(uint8_t value) noexcept {
    switch (static_cast<RelocationType>(value)) {
        case RelocationType::REL32_BE:
        case RelocationType::REL32:
        case RelocationType::REL26:
        case RelocationType::HI16:
        case RelocationType::LO16:
        case RelocationType::REL26_BE:
        case RelocationType::HI16_BE:
        case RelocationType::LO16_BE:
        case RelocationType::GPREL16:
            return static_cast<RelocationType>(value);
        default:
            return std::nullopt;
    }
}

std::string_view relocation_type_name(RelocationType type) noexcept;

// =============================================================================
// RELOCATION EXPRESSIONS
// =============================================================================

/**
 * @brief Opcodes of the relocation expression language
 *
 * Leaves carry an immediate: VALUE a 32-bit constant, the others a 16-bit
 * symbol or section index. Operators carry no immediate and are followed by
 * their left then right operand, each a complete expression.
 */
enum class ExpressionOpcode : uint8_t {
    VALUE         = 0,
    SYMBOL        = 2,
    SECTION_BASE  = 4,
    SECTION_START = 12,
    SECTION_END   = 22,
    ADD           = 44,
    SUB           = 46,
    DIV           = 50
};

/**
 * @brief Whether a name fits the one byte length prefix used by every record
 */
constexpr bool fits_name_length(size_t length) noexcept {
    return length <= 0xFF;
}

} // namespace psyq
