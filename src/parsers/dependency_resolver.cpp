#include "pch.h"
#include "dependency_resolver.hpp"
#include "line_scanner.hpp"

namespace slnmodel {

bool DependencyResolver::is_braced_guid(const std::string& text) {
    if (text.size() < 3 || text.front() != '{' || text.back() != '}') {
        return false;
    }
    return text.find_first_of("{}", 1) == text.size() - 1;
}

std::vector<std::string> DependencyResolver::resolve_dependencies(const std::vector<PropertyEntry>& entries) {
    std::vector<std::string> dependencies;

    for (const auto& entry : entries) {
        if (entry.key.empty()) {
            m_diag.warning(entry.line, "project dependency without an identifier ignored");
            continue;
        }
        if (!is_braced_guid(entry.key)) {
            m_diag.warning(entry.line, "malformed project dependency '" + entry.key + "' ignored");
            continue;
        }
        dependencies.push_back(entry.key);
    }

    return dependencies;
}

std::vector<ProjectReference> DependencyResolver::resolve_references(const std::string& value, int line) {
    std::vector<ProjectReference> references;

    // File names may themselves contain ';', so a fragment without '|'
    // directly after a good entry continues that entry's file name.
    bool previous_ok = false;
    std::stringstream stream(value);
    std::string part;
    while (std::getline(stream, part, ';')) {
        if (LineScanner::trim(part).empty()) {
            continue;
        }

        size_t bar = part.find('|');
        if (bar == std::string::npos) {
            if (previous_ok) {
                references.back().file_name += ";" + part;
            } else {
                m_diag.warning(line, "malformed project reference '" + part + "' ignored");
            }
            continue;
        }

        std::string guid = LineScanner::trim(part.substr(0, bar));
        if (guid.empty()) {
            m_diag.warning(line, "project reference without an identifier ignored");
            previous_ok = false;
            continue;
        }
        if (!is_braced_guid(guid)) {
            m_diag.warning(line, "malformed project reference '" + part + "' ignored");
            previous_ok = false;
            continue;
        }

        references.push_back({guid, part.substr(bar + 1)});
        previous_ok = true;
    }

    return references;
}

} // namespace slnmodel
