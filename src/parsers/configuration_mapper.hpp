#pragma once

#include "common/diagnostics.hpp"
#include "common/solution_types.hpp"

namespace slnmodel {

// Decodes SolutionConfigurationPlatforms and ProjectConfigurationPlatforms.
//
// A project is mapped into a solution configuration when
//   {GUID}.<Config>|<Platform>.ActiveCfg = <ProjectConfig>[|<ProjectPlatform>]
// exists, and is built there only when the matching .Build.0 key exists too.
class ConfigurationMapper {
public:
    explicit ConfigurationMapper(Diagnostics& diagnostics) : m_diag(diagnostics) {}

    std::vector<SolutionConfiguration> parse_solution_configurations(
        const std::vector<PropertyEntry>& entries) const;

    void map_projects(const std::vector<PropertyEntry>& entries,
                      const std::vector<SolutionConfiguration>& solution_configs,
                      std::vector<ProjectEntry>& projects) const;

private:
    void require_single_separator(const PropertyEntry& entry) const;

    Diagnostics& m_diag;
};

} // namespace slnmodel
