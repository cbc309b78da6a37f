#include "pch.h"
#include "block_parser.hpp"
#include <limits>

namespace slnmodel {

namespace {

const std::string kHeaderPrefix = "Microsoft Visual Studio Solution File, Format Version ";

// Oldest format the grammar below understands, and newest it was written against
constexpr int kMinFormatMajor = 7;
constexpr int kMaxKnownFormatMajor = 12;

std::string describe(const RawBlock& block) {
    if (block.kind == BlockKind::Project) {
        std::string name = block.header_fields.size() > 1 ? block.header_fields[1] : "";
        return "Project(\"" + name + "\")";
    }
    const char* keyword = block.kind == BlockKind::ProjectSection ? "ProjectSection" : "GlobalSection";
    return std::string(keyword) + "(" + block.name + ")";
}

} // namespace

bool BlockParser::starts_with(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

std::string BlockParser::unquote(const std::string& value) const {
    const char q = m_options.quote_char;
    if (value.size() < 2 || value.front() != q || value.back() != q) {
        return value;
    }

    std::string inner = value.substr(1, value.size() - 2);
    std::string result;
    result.reserve(inner.size());
    for (size_t i = 0; i < inner.size(); ++i) {
        result += inner[i];
        if (inner[i] == q && i + 1 < inner.size() && inner[i + 1] == q) {
            ++i;
        }
    }
    return result;
}

PropertyEntry BlockParser::parse_property(const std::string& text, int line) const {
    PropertyEntry entry;
    entry.line = line;

    size_t eq = text.find('=');
    if (eq == std::string::npos) {
        entry.key = text;
        entry.has_separator = false;
        return entry;
    }

    entry.key = LineScanner::trim(text.substr(0, eq));
    entry.raw_value = LineScanner::trim(text.substr(eq + 1));
    entry.value = unquote(entry.raw_value);
    return entry;
}

std::string BlockParser::read_quoted(const ScannedLine& line, size_t& pos) const {
    const std::string& text = line.text;
    const char q = m_options.quote_char;

    while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
    if (pos >= text.size() || text[pos] != q) {
        throw m_diag.error(line.line, "expected quoted value in Project header", text.substr(std::min(pos, text.size())));
    }
    ++pos;

    std::string value;
    while (pos < text.size()) {
        if (text[pos] == q) {
            if (pos + 1 < text.size() && text[pos + 1] == q) {
                value += q;
                pos += 2;
                continue;
            }
            ++pos;
            return value;
        }
        value += text[pos++];
    }

    throw m_diag.error(line.line, "unterminated quoted value in Project header", value);
}

RawBlock BlockParser::parse_project_header(const ScannedLine& line) const {
    // Project("{TYPE}") = "Name", "Path", "{GUID}"
    static const char* const field_names[] = {"name", "path", "guid"};

    RawBlock block;
    block.kind = BlockKind::Project;
    block.line = line.line;

    const std::string& text = line.text;
    size_t pos = std::string("Project(").size();

    block.header_fields.push_back(read_quoted(line, pos));

    auto expect = [&](char c) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
        if (pos >= text.size() || text[pos] != c) {
            throw m_diag.error(line.line, std::string("malformed Project header, expected '") + c + "'", text);
        }
        ++pos;
    };

    expect(')');
    expect('=');

    for (int i = 0; i < 3; ++i) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
        if (pos >= text.size()) {
            throw m_diag.error(line.line, std::string("Project header is missing its ") + field_names[i], text);
        }
        block.header_fields.push_back(read_quoted(line, pos));
        if (i < 2) {
            while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
            if (pos >= text.size()) {
                throw m_diag.error(line.line, std::string("Project header is missing its ") + field_names[i + 1], text);
            }
            expect(',');
        }
    }

    return block;
}

RawBlock BlockParser::parse_section_header(const ScannedLine& line, BlockKind kind) const {
    static const std::regex section_re(R"(^(ProjectSection|GlobalSection)\s*\(([^)]*)\)\s*=\s*(.*)$)");

    std::smatch match;
    if (!std::regex_match(line.text, match, section_re)) {
        throw m_diag.error(line.line, "malformed section header", line.text);
    }

    RawBlock block;
    block.kind = kind;
    block.line = line.line;
    block.name = LineScanner::trim(match[2].str());
    if (block.name.empty()) {
        throw m_diag.error(line.line, "section header is missing its name", line.text);
    }

    std::string order_text = LineScanner::trim(match[3].str());
    block.order = parse_section_order(order_text);
    if (!block.order) {
        throw m_diag.error(line.line, "invalid section order", order_text);
    }

    bool project_order = *block.order == SectionOrder::PreProject || *block.order == SectionOrder::PostProject;
    if ((kind == BlockKind::ProjectSection) != project_order) {
        throw m_diag.error(line.line, "section order does not match section kind", order_text);
    }

    return block;
}

SolutionParseError BlockParser::unterminated(const RawBlock& block, const std::string& token) const {
    return m_diag.error(block.line, describe(block) + " is not terminated", token);
}

size_t BlockParser::parse_header(const ScanResult& scan, RawDocument& doc) {
    // The header must sit on one of the first two physical lines
    size_t index = 0;
    bool found = false;
    for (; index < scan.lines.size() && scan.lines[index].line <= 2; ++index) {
        if (starts_with(scan.lines[index].text, kHeaderPrefix.c_str())) {
            found = true;
            break;
        }
    }

    if (!found) {
        std::string token = scan.lines.empty() ? "" : scan.lines.front().text;
        throw m_diag.error(scan.lines.empty() ? 1 : scan.lines.front().line,
                           "no solution file header found", token);
    }

    const ScannedLine& header = scan.lines[index];
    doc.format_version = LineScanner::trim(header.text.substr(kHeaderPrefix.size()));

    try {
        doc.format_major = std::stoi(doc.format_version.substr(0, doc.format_version.find('.')));
    } catch (const std::exception&) {
        throw m_diag.error(header.line, "invalid format version", doc.format_version);
    }

    if (doc.format_major < kMinFormatMajor) {
        throw m_diag.error(header.line, "unsupported format version", doc.format_version);
    }
    if (doc.format_major > kMaxKnownFormatMajor) {
        m_diag.comment("format version " + doc.format_version + " is newer than this parser; unknown content is ignored");
    }

    // "# Visual Studio Version 17" right after the header
    int next_line = index + 1 < scan.lines.size() ? scan.lines[index + 1].line : std::numeric_limits<int>::max();
    for (const auto& comment : scan.comments) {
        if (comment.line > header.line && comment.line < next_line) {
            doc.product_description = comment.text;
            break;
        }
    }

    return index + 1;
}

RawDocument BlockParser::parse(const ScanResult& scan) {
    RawDocument doc;
    doc.file = m_diag.file();

    size_t index = parse_header(scan, doc);

    State state = State::Start;
    RawBlock project;
    RawBlock section;
    int global_line = 0;

    for (; index < scan.lines.size(); ++index) {
        const ScannedLine& line = scan.lines[index];
        const std::string& text = line.text;

        switch (state) {
        case State::Start:
        case State::AfterGlobal:
            if (starts_with(text, "Project(")) {
                if (state == State::AfterGlobal) {
                    throw m_diag.error(line.line, "Project block after Global", text);
                }
                project = parse_project_header(line);
                state = State::InProject;
            } else if (text == "Global") {
                if (doc.has_global) {
                    throw m_diag.error(line.line, "Global may appear only once", text);
                }
                doc.has_global = true;
                global_line = line.line;
                state = State::InGlobal;
            } else if (starts_with(text, "ProjectSection(")) {
                throw m_diag.error(line.line, "ProjectSection outside of a Project block", text);
            } else if (starts_with(text, "GlobalSection(")) {
                throw m_diag.error(line.line, "GlobalSection outside of Global", text);
            } else if (text == "EndProject" || text == "EndProjectSection" ||
                       text == "EndGlobalSection" || text == "EndGlobal") {
                m_diag.warning(line.line, "unexpected '" + text + "' ignored");
            } else if (state == State::Start && text.find('=') != std::string::npos) {
                doc.header_properties.push_back(parse_property(text, line.line));
            }
            break;

        case State::InProject:
            if (starts_with(text, "ProjectSection(")) {
                section = parse_section_header(line, BlockKind::ProjectSection);
                state = State::InProjectSection;
            } else if (text == "EndProject") {
                doc.projects.push_back(std::move(project));
                state = State::Start;
            } else if (starts_with(text, "Project(")) {
                m_diag.warning(project.line, describe(project) + " has no EndProject; closed at line " +
                                             std::to_string(line.line));
                doc.projects.push_back(std::move(project));
                project = parse_project_header(line);
            } else if (starts_with(text, "GlobalSection(")) {
                throw m_diag.error(line.line, "GlobalSection inside a Project block", text);
            } else if (text == "Global") {
                throw unterminated(project, text);
            }
            break;

        case State::InProjectSection:
            if (text == "EndProjectSection") {
                project.children.push_back(std::move(section));
                state = State::InProject;
            } else if (starts_with(text, "ProjectSection(") || starts_with(text, "GlobalSection(") ||
                       starts_with(text, "Project(") || text == "EndProject" || text == "Global") {
                throw unterminated(section, text);
            } else {
                section.entries.push_back(parse_property(text, line.line));
            }
            break;

        case State::InGlobal:
            if (starts_with(text, "GlobalSection(")) {
                section = parse_section_header(line, BlockKind::GlobalSection);
                state = State::InGlobalSection;
            } else if (text == "EndGlobal") {
                state = State::AfterGlobal;
            } else if (starts_with(text, "ProjectSection(")) {
                throw m_diag.error(line.line, "ProjectSection outside of a Project block", text);
            } else if (starts_with(text, "Project(") || text == "Global") {
                throw m_diag.error(global_line, "Global is not terminated", text);
            }
            break;

        case State::InGlobalSection:
            if (text == "EndGlobalSection") {
                doc.global_sections.push_back(std::move(section));
                state = State::InGlobal;
            } else if (starts_with(text, "GlobalSection(") || starts_with(text, "ProjectSection(") ||
                       starts_with(text, "Project(") || text == "Global" || text == "EndGlobal") {
                throw unterminated(section, text);
            } else {
                section.entries.push_back(parse_property(text, line.line));
            }
            break;
        }
    }

    switch (state) {
    case State::InProject:
        throw unterminated(project, "EndProject");
    case State::InProjectSection:
        throw unterminated(section, "EndProjectSection");
    case State::InGlobal:
        throw m_diag.error(global_line, "Global is not terminated", "EndGlobal");
    case State::InGlobalSection:
        throw unterminated(section, "EndGlobalSection");
    default:
        break;
    }

#ifndef NDEBUG
    if (m_options.echo_warnings) {
        std::cout << "[DEBUG] " << doc.file << ": " << doc.projects.size() << " project block(s), "
                  << doc.global_sections.size() << " global section(s)\n";
    }
#endif

    return doc;
}

} // namespace slnmodel
