#include "pch.h"
#include "sln_reader.hpp"
#include "block_parser.hpp"
#include "common/diagnostics.hpp"
#include "line_scanner.hpp"
#include "solution_builder.hpp"

namespace slnmodel {

SolutionModel SlnReader::read_sln(const std::string& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        throw SerializerError(filepath, "cannot open solution file");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw SerializerError(filepath, "cannot read solution file");
    }

    return parse_string(buffer.str(), filepath);
}

SolutionModel SlnReader::parse_string(const std::string& content, const std::string& filename) {
    Diagnostics diagnostics(filename, m_options.echo_warnings);

    LineScanner scanner(m_options.comment_char);
    ScanResult scan = scanner.scan(content);

    BlockParser parser(m_options, diagnostics);
    RawDocument document = parser.parse(scan);

    SolutionBuilder builder(m_options, diagnostics);
    return builder.build(document);
}

} // namespace slnmodel
