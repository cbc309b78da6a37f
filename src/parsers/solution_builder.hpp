#pragma once

#include "common/diagnostics.hpp"
#include "common/parse_options.hpp"
#include "common/solution_types.hpp"
#include "parsers/block_parser.hpp"

namespace slnmodel {

// Assembles recognized blocks into a SolutionModel: classifies entries,
// decodes their sections, maps configurations and resolves nesting.
class SolutionBuilder {
public:
    SolutionBuilder(const ParseOptions& options, Diagnostics& diagnostics)
        : m_options(options), m_diag(diagnostics) {}

    SolutionModel build(const RawDocument& document);

    // Replace % $ @ ; . ( ) ' with '_'
    static std::string cleanse_name(const std::string& name);

private:
    ProjectEntry build_entry(const RawBlock& block);
    void apply_nesting(const std::vector<PropertyEntry>& entries, SolutionModel& model);
    void assign_unique_names(SolutionModel& model);
    void assign_display_paths(SolutionModel& model);

    const ParseOptions& m_options;
    Diagnostics& m_diag;
};

} // namespace slnmodel
