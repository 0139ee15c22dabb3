#include "psyq.hpp"

namespace psyq {

std::string_view opcode_name(uint8_t opcode) noexcept
{
    switch (static_cast<Opcode>(opcode)) {
        case Opcode::END:                     return "END";
        case Opcode::BYTES:                   return "BYTES";
        case Opcode::SWITCH:                  return "SWITCH";
        case Opcode::ZEROES:                  return "ZEROES";
        case Opcode::RELOCATION:              return "RELOCATION";
        case Opcode::EXPORTED_SYMBOL:         return "EXPORTED_SYMBOL";
        case Opcode::IMPORTED_SYMBOL:         return "IMPORTED_SYMBOL";
        case Opcode::SECTION:                 return "SECTION";
        case Opcode::LOCAL_SYMBOL:            return "LOCAL_SYMBOL";
        case Opcode::FILENAME:                return "FILENAME";
        case Opcode::PROGRAMTYPE:             return "PROGRAMTYPE";
        case Opcode::UNINITIALIZED:           return "UNINITIALIZED";
        case Opcode::INC_SLD_LINENUM:         return "INC_SLD_LINENUM";
        case Opcode::INC_SLD_LINENUM_BY_BYTE: return "INC_SLD_LINENUM_BY_BYTE";
        case Opcode::INC_SLD_LINENUM_BY_WORD: return "INC_SLD_LINENUM_BY_WORD";
        case Opcode::SET_SLD_LINENUM:         return "SET_SLD_LINENUM";
        case Opcode::SET_SLD_LINENUM_FILE:    return "SET_SLD_LINENUM_FILE";
        case Opcode::END_SLD:                 return "END_SLD";
        case Opcode::FUNCTION:                return "FUNCTION";
        case Opcode::FUNCTION_END:            return "FUNCTION_END";
        case Opcode::BLOCK_START:             return "BLOCK_START";
        case Opcode::BLOCK_END:               return "BLOCK_END";
        case Opcode::SECTION_DEF:             return "SECTION_DEF";
        case Opcode::SECTION_DEF2:            return "SECTION_DEF2";
        case Opcode::FUNCTION_START2:         return "FUNCTION_START2";
    }
    return {};
}

std::string_view relocation_type_name(RelocationType type) noexcept
{
    switch (type) {
        case RelocationType::REL32_BE: return "REL32_BE";
        case RelocationType::REL32:    return "REL32";
        case RelocationType::REL26:    return "REL26";
        case RelocationType::HI16:     return "HI16";
        case RelocationType::LO16:     return "LO16";
        case RelocationType::REL26_BE: return "REL26_BE";
        case RelocationType::HI16_BE:  return "HI16_BE";
        case RelocationType::LO16_BE:  return "LO16_BE";
        case RelocationType::GPREL16:  return "GPREL16";
    }
    return "UNKNOWN";
}

} // namespace psyq
