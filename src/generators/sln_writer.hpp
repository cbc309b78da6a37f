#pragma once

#include "common/solution_types.hpp"
#include <ostream>

namespace slnmodel {

// Writes a SolutionModel in the line-oriented .sln format
class SlnWriter {
public:
    explicit SlnWriter(char quote_char = '"') : m_quote(quote_char) {}

    // Write a solution file
    // Returns true on success, false on failure
    bool write_sln(const SolutionModel& model, const std::string& output_path) const;

    // Render to a string (for testing)
    std::string write_string(const SolutionModel& model) const;

private:
    void write(std::ostream& out, const SolutionModel& model) const;
    void write_project(std::ostream& out, const ProjectEntry& proj) const;
    void write_section(std::ostream& out, const char* keyword, const SolutionSection& section) const;
    std::string quote(const std::string& value) const;

    char m_quote;
};

} // namespace slnmodel
