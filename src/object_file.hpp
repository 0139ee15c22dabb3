#pragma once
#include "expression.hpp"
#include "psyq.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace psyq {

// offset/size locate the section's payload in the original buffer and stay
// zero until a BYTES record for the section has been read.
struct Section {
    uint16_t index = 0;
    uint16_t group = 0;
    uint8_t alignment = 0;
    std::string name;
    uint32_t offset = 0;
    uint32_t size = 0;

    bool operator==(const Section&) const = default;
};

struct ImportedSymbol {
    uint16_t index = 0;
    std::string name;

    bool operator==(const ImportedSymbol&) const = default;
};

struct ExportedSymbol {
    uint16_t index = 0;
    uint16_t sectionIndex = 0;
    uint32_t offset = 0;
    std::string name;

    bool operator==(const ExportedSymbol&) const = default;
};

struct Relocation {
    RelocationType type = RelocationType::REL32;
    uint32_t offset = 0; // absolute position in the input buffer
    Expression target;

    bool operator==(const Relocation& other) const {
        return type == other.type && offset == other.offset && target == other.target;
    }
};

class ObjectFile
{
    std::map<uint16_t, Section> sectionTable;
    std::vector<ImportedSymbol> importList;
    std::vector<ExportedSymbol> exportList;
    std::vector<Relocation> relocationList;
    std::optional<uint8_t> programTypeValue;

public:
    // Index-sorted; callers must not rely on the order records appeared in.
    const std::map<uint16_t, Section>& sections() const { return sectionTable; }
    const std::vector<ImportedSymbol>& imports() const { return importList; }
    const std::vector<ExportedSymbol>& exports() const { return exportList; }
    const std::vector<Relocation>& relocations() const { return relocationList; }
    std::optional<uint8_t> programType() const { return programTypeValue; }

    // Throws InvalidSectionReference when no section has this index.
    const Section& section(uint16_t index) const;
    const Section* findSection(uint16_t index) const;
    Section* findSection(uint16_t index);

    bool empty() const;

    /**
     * Check that every section named by an export or a relocation expression
     * exists. Decoding never does this because records may refer forward.
     * Throws InvalidSectionReference for the first dangling reference; the
     * error offset is the export's offset field or the relocation's
     * absolute offset.
     */
    void resolveReferences() const;

    // --- Builders, for encoders and tests ---
    void addSection(Section section);
    void addImport(ImportedSymbol symbol);
    void addExport(ExportedSymbol symbol);
    void addRelocation(Relocation relocation);
    void setProgramType(uint8_t value) { programTypeValue = value; }

    bool operator==(const ObjectFile& other) const;
    bool operator!=(const ObjectFile& other) const { return !(*this == other); }
};

} // namespace psyq
