#pragma once

#include "common/diagnostics.hpp"
#include "common/parse_options.hpp"
#include "common/solution_types.hpp"
#include "parsers/line_scanner.hpp"

namespace slnmodel {

enum class BlockKind {
    Project,         // Project(...) ... EndProject
    ProjectSection,  // ProjectSection(Name) = preProject ... EndProjectSection
    GlobalSection    // GlobalSection(Name) = preSolution ... EndGlobalSection
};

// A recognized block before any semantic interpretation
struct RawBlock {
    BlockKind kind = BlockKind::Project;
    std::string name;                        // Section name; empty for projects
    std::vector<std::string> header_fields;  // Project: type, name, path, guid
    std::optional<SectionOrder> order;       // Sections only
    std::vector<PropertyEntry> entries;
    std::vector<RawBlock> children;          // Sections of a project
    int line = 0;
};

// Everything the block parser recognized in one descriptor
struct RawDocument {
    std::string file;
    std::string format_version;
    int format_major = 0;
    std::string product_description;
    std::vector<PropertyEntry> header_properties;
    std::vector<RawBlock> projects;
    std::vector<RawBlock> global_sections;
    bool has_global = false;
};

// Block parser for the line-oriented solution grammar.
// Fatal problems throw SolutionParseError; recoverable ones become warnings.
class BlockParser {
public:
    BlockParser(const ParseOptions& options, Diagnostics& diagnostics)
        : m_options(options), m_diag(diagnostics) {}

    RawDocument parse(const ScanResult& scan);

    // "key = value" -> entry with the value unquoted
    PropertyEntry parse_property(const std::string& text, int line) const;

    // Strip surrounding quote characters and collapse doubled quotes
    std::string unquote(const std::string& value) const;

private:
    enum class State {
        Start,             // Before Global; projects and header properties
        InProject,
        InProjectSection,
        InGlobal,
        InGlobalSection,
        AfterGlobal
    };

    size_t parse_header(const ScanResult& scan, RawDocument& doc);
    RawBlock parse_project_header(const ScannedLine& line) const;
    RawBlock parse_section_header(const ScannedLine& line, BlockKind kind) const;
    std::string read_quoted(const ScannedLine& line, size_t& pos) const;

    SolutionParseError unterminated(const RawBlock& block, const std::string& token) const;

    static bool starts_with(const std::string& text, const char* prefix);

    const ParseOptions& m_options;
    Diagnostics& m_diag;
};

} // namespace slnmodel
