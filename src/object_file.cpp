#include "object_file.hpp"
#include "errors.hpp"

namespace psyq {

const Section& ObjectFile::section(uint16_t index) const
{
    const auto* found = findSection(index);
    if (!found) {
        throw ParseError(ErrorKind::InvalidSectionReference, 0,
                         "no section with index " + std::to_string(index));
    }
    return *found;
}

const Section* ObjectFile::findSection(uint16_t index) const
{
    auto it = sectionTable.find(index);
    return it == sectionTable.end() ? nullptr : &it->second;
}

Section* ObjectFile::findSection(uint16_t index)
{
    auto it = sectionTable.find(index);
    return it == sectionTable.end() ? nullptr : &it->second;
}

bool ObjectFile::empty() const
{
    return sectionTable.empty() && importList.empty() && exportList.empty() && relocationList.empty();
}

void ObjectFile::resolveReferences() const
{
    for (const auto& symbol : exportList) {
        if (!findSection(symbol.sectionIndex)) {
            throw ParseError(ErrorKind::InvalidSectionReference, symbol.offset,
                             "export '" + symbol.name + "' refers to missing section " +
                             std::to_string(symbol.sectionIndex));
        }
    }

    for (const auto& reloc : relocationList) {
        for (auto index : reloc.target.section_references()) {
            if (!findSection(index)) {
                throw ParseError(ErrorKind::InvalidSectionReference, reloc.offset,
                                 "relocation target " + reloc.target.to_string() +
                                 " refers to missing section " + std::to_string(index));
            }
        }
    }
}

void ObjectFile::addSection(Section section)
{
    auto index = section.index;
    sectionTable.insert_or_assign(index, std::move(section));
}

void ObjectFile::addImport(ImportedSymbol symbol)
{
    importList.push_back(std::move(symbol));
}

void ObjectFile::addExport(ExportedSymbol symbol)
{
    exportList.push_back(std::move(symbol));
}

void ObjectFile::addRelocation(Relocation relocation)
{
    relocationList.push_back(std::move(relocation));
}

bool ObjectFile::operator==(const ObjectFile& other) const
{
    return sectionTable == other.sectionTable &&
           importList == other.importList &&
           exportList == other.exportList &&
           relocationList == other.relocationList &&
           programTypeValue == other.programTypeValue;
}

} // namespace psyq
