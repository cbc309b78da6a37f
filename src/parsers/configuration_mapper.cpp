#include "pch.h"
#include "configuration_mapper.hpp"

namespace slnmodel {

namespace {

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::stringstream stream(text);
    std::string part;
    while (std::getline(stream, part, delimiter)) {
        parts.push_back(part);
    }
    if (!text.empty() && text.back() == delimiter) {
        parts.push_back("");
    }
    return parts;
}

} // namespace

void ConfigurationMapper::require_single_separator(const PropertyEntry& entry) const {
    if (!entry.has_separator || entry.raw_value.find('=') != std::string::npos) {
        throw m_diag.error(entry.line, "configuration entry must contain exactly one '='", entry.key);
    }
}

std::vector<SolutionConfiguration> ConfigurationMapper::parse_solution_configurations(
    const std::vector<PropertyEntry>& entries) const {
    std::vector<SolutionConfiguration> configs;

    for (const auto& entry : entries) {
        require_single_separator(entry);

        if (iequals(entry.key, "DESCRIPTION")) {
            continue;
        }

        if (entry.key != entry.value) {
            throw m_diag.error(entry.line, "solution configuration name and value differ",
                               entry.key + " = " + entry.value);
        }

        std::vector<std::string> parts = split(entry.key, '|');
        if (parts.size() != 2) {
            throw m_diag.error(entry.line, "solution configuration must be Configuration|Platform", entry.key);
        }

        configs.push_back({parts[0], parts[1]});
    }

    return configs;
}

void ConfigurationMapper::map_projects(const std::vector<PropertyEntry>& entries,
                                       const std::vector<SolutionConfiguration>& solution_configs,
                                       std::vector<ProjectEntry>& projects) const {
    std::map<std::string, const PropertyEntry*, CaseInsensitiveLess> raw;
    for (const auto& entry : entries) {
        require_single_separator(entry);
        raw[entry.key] = &entry;
    }

    for (auto& proj : projects) {
        if (proj.is_folder()) {
            continue;
        }

        for (const auto& config : solution_configs) {
            std::string prefix = proj.guid + "." + config.full_name();

            auto active = raw.find(prefix + ".ActiveCfg");
            if (active == raw.end()) {
                continue;
            }

            std::vector<std::string> parts = split(active->second->value, '|');
            if (parts.empty() || parts.size() > 2) {
                throw m_diag.error(active->second->line, "invalid project configuration", active->second->value);
            }

            ProjectConfiguration mapped;
            mapped.configuration = parts[0];
            mapped.platform = parts.size() > 1 ? parts[1] : "";
            if (mapped.platform == "Any CPU") {
                mapped.platform = "AnyCPU";
            }
            mapped.build = raw.count(prefix + ".Build.0") > 0;

            proj.configurations[config.full_name()] = mapped;
        }
    }
}

} // namespace slnmodel
