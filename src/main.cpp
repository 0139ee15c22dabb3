#include "parser.hpp"
#include "errors.hpp"
#include <iostream>
#include <iomanip>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>
#include <argparse.hpp>

using namespace psyq;

std::vector<uint8_t> read_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + filename);
    }

    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

static std::string hex(uint32_t value, int width = 8) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setw(width) << std::setfill('0') << value;
    return oss.str();
}

static void print_sections(const ObjectFile& object) {
    std::cout << "Sections (" << object.sections().size() << "):\n";
    for (const auto& [index, section] : object.sections()) {
        std::cout << "  [" << std::setw(4) << index << "] "
                  << std::left << std::setw(12) << section.name << std::right
                  << " group " << section.group
                  << " align " << static_cast<int>(section.alignment)
                  << " offset " << hex(section.offset)
                  << " size " << hex(section.size) << "\n";
    }
}

static void print_symbols(const ObjectFile& object) {
    std::cout << "Imports (" << object.imports().size() << "):\n";
    for (const auto& symbol : object.imports()) {
        std::cout << "  [" << std::setw(4) << symbol.index << "] " << symbol.name << "\n";
    }

    std::cout << "Exports (" << object.exports().size() << "):\n";
    for (const auto& symbol : object.exports()) {
        std::cout << "  [" << std::setw(4) << symbol.index << "] " << symbol.name
                  << " = section " << symbol.sectionIndex << " + " << hex(symbol.offset) << "\n";
    }
}

static void print_relocations(const ObjectFile& object) {
    std::cout << "Relocations (" << object.relocations().size() << "):\n";
    for (const auto& reloc : object.relocations()) {
        std::cout << "  " << hex(reloc.offset) << " "
                  << std::left << std::setw(8) << relocation_type_name(reloc.type) << std::right
                  << " " << reloc.target.to_string() << "\n";
    }
}

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("psyqdump", "0.1.0", argparse::default_arguments::all);

    program.add_argument("filename")
        .help("The LNK object file to dump")
        .required();

    program.add_argument("--sections")
        .help("Print the section table")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--symbols")
        .help("Print imported and exported symbols")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--relocations", "-r")
        .help("Print relocations and their target expressions")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--all", "-a")
        .help("Print everything (default when nothing else is selected)")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--resolve")
        .help("Fail if an export or relocation refers to a missing section")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--quiet", "-q")
        .help("Suppress warnings")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("--max-expression-depth")
        .help("Deepest relocation expression accepted")
        .default_value(64)
        .scan<'i', int>();

    try {
        program.parse_args(argc, argv);
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    std::string filename = program.get<std::string>("filename");
    bool all = program.get<bool>("--all");
    bool sections = program.get<bool>("--sections");
    bool symbols = program.get<bool>("--symbols");
    bool relocations = program.get<bool>("--relocations");
    if (!sections && !symbols && !relocations) {
        all = true;
    }

    ParseOptions options;
    int depth = program.get<int>("--max-expression-depth");
    if (depth < 0) {
        std::cerr << "Error: --max-expression-depth must not be negative\n";
        return 1;
    }
    options.maxExpressionDepth = static_cast<size_t>(depth);

    StreamDiagnostics stderrDiagnostics(std::cerr);
    NullDiagnostics silent;
    DiagnosticSink& diagnostics = program.get<bool>("--quiet")
        ? static_cast<DiagnosticSink&>(silent)
        : static_cast<DiagnosticSink&>(stderrDiagnostics);

    try {
        auto data = read_file(filename);
        if (!is_valid_for_data(data)) {
            std::cerr << "Error: " << filename << " is not a PSY-Q LNK object\n";
            return 1;
        }

        Parser parser(data, diagnostics, options);
        auto object = parser.parse();

        if (program.get<bool>("--resolve")) {
            object.resolveReferences();
        }

        std::cout << filename << ": " << data.size() << " bytes";
        if (auto type = object.programType()) {
            std::cout << ", program type " << static_cast<int>(*type);
        }
        std::cout << "\n";

        if (all || sections) print_sections(object);
        if (all || symbols) print_symbols(object);
        if (all || relocations) print_relocations(object);

    } catch (const ParseError& e) {
        std::cerr << "Error: " << filename << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
