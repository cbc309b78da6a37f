#pragma once

#include "common/diagnostics.hpp"
#include "common/solution_types.hpp"

namespace slnmodel {

// Decodes the two identifier lists a project block can carry:
//   ProjectDependencies section:  {GUID} = {GUID}
//   WebsiteProperties value:      ProjectReferences = "{GUID}|File.dll;{GUID}|Other.dll;"
// Malformed entries are dropped with a warning.
class DependencyResolver {
public:
    explicit DependencyResolver(Diagnostics& diagnostics) : m_diag(diagnostics) {}

    // Ordered dependency identifiers, duplicates kept
    std::vector<std::string> resolve_dependencies(const std::vector<PropertyEntry>& entries);

    // Ordered references; the file name after '|' is kept
    std::vector<ProjectReference> resolve_references(const std::string& value, int line);

    // "{...}" with exactly one pair of braces
    static bool is_braced_guid(const std::string& text);

private:
    Diagnostics& m_diag;
};

} // namespace slnmodel
