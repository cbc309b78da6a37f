#pragma once

#include "common/parse_options.hpp"
#include "common/solution_types.hpp"

namespace slnmodel {

// Reader for the line-oriented .sln format.
// Runs scanner -> block parser -> model builder over one input.
class SlnReader {
public:
    explicit SlnReader(ParseOptions options = {}) : m_options(options) {}

    // Parse a .sln file; I/O failures throw SerializerError
    SolutionModel read_sln(const std::string& filepath);

    // Parse from string content (for testing)
    SolutionModel parse_string(const std::string& content, const std::string& filename = "<memory>");

private:
    ParseOptions m_options;
};

} // namespace slnmodel
