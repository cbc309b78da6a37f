#include "pch.h"
#include "solution_types.hpp"

namespace slnmodel {

std::string project_type_to_string(ProjectType type) {
    switch (type) {
        case ProjectType::Project: return "Project";
        case ProjectType::SolutionFolder: return "SolutionFolder";
        case ProjectType::WebProject: return "WebProject";
        case ProjectType::WebDeploymentProject: return "WebDeploymentProject";
        case ProjectType::SharedProject: return "SharedProject";
        case ProjectType::Unknown: return "Unknown";
    }
    return "Unknown";
}

std::optional<SectionOrder> parse_section_order(const std::string& text) {
    if (text == "preProject") return SectionOrder::PreProject;
    if (text == "postProject") return SectionOrder::PostProject;
    if (text == "preSolution") return SectionOrder::PreSolution;
    if (text == "postSolution") return SectionOrder::PostSolution;
    return std::nullopt;
}

std::string section_order_to_string(SectionOrder order) {
    switch (order) {
        case SectionOrder::PreProject: return "preProject";
        case SectionOrder::PostProject: return "postProject";
        case SectionOrder::PreSolution: return "preSolution";
        case SectionOrder::PostSolution: return "postSolution";
    }
    return "preProject";
}

ProjectType classify_project_type(const std::string& type_guid) {
    namespace g = project_type_guids;

    static const char* const ordinary[] = {
        g::VisualBasic, g::CSharp, g::Cps, g::CpsCSharp, g::CpsVisualBasic, g::CpsFSharp,
        g::JSharp, g::VisualCpp, g::FSharp, g::Database, g::Synergex
    };
    for (const char* known : ordinary) {
        if (iequals(type_guid, known)) return ProjectType::Project;
    }

    if (iequals(type_guid, g::SolutionFolder)) return ProjectType::SolutionFolder;
    if (iequals(type_guid, g::WebProject)) return ProjectType::WebProject;
    if (iequals(type_guid, g::WebDeployment)) return ProjectType::WebDeploymentProject;
    if (iequals(type_guid, g::SharedProject)) return ProjectType::SharedProject;

    return ProjectType::Unknown;
}

const PropertyEntry* SolutionSection::find(const std::string& key) const {
    for (const auto& entry : entries) {
        if (iequals(entry.key, key)) {
            return &entry;
        }
    }
    return nullptr;
}

const ProjectConfiguration* ProjectEntry::configuration_for(const std::string& solution_config) const {
    auto it = configurations.find(solution_config);
    return it == configurations.end() ? nullptr : &it->second;
}

const SolutionSection* ProjectEntry::find_section(const std::string& section_name) const {
    for (const auto& section : sections) {
        if (section.name == section_name) {
            return &section;
        }
    }
    return nullptr;
}

const ProjectEntry* SolutionModel::find_project(const std::string& guid) const {
    for (const auto& proj : projects) {
        if (iequals(proj.guid, guid)) {
            return &proj;
        }
    }
    return nullptr;
}

const ProjectEntry* SolutionModel::find_project_by_unique_name(const std::string& unique_name) const {
    for (const auto& proj : projects) {
        if (iequals(proj.unique_name, unique_name)) {
            return &proj;
        }
    }
    return nullptr;
}

std::vector<const ProjectEntry*> SolutionModel::children_of(const std::string& guid) const {
    std::vector<const ProjectEntry*> children;
    for (const auto& proj : projects) {
        if (proj.parent_guid && iequals(*proj.parent_guid, guid)) {
            children.push_back(&proj);
        }
    }
    return children;
}

const SolutionSection* SolutionModel::find_global_section(const std::string& name) const {
    for (const auto& section : global_sections) {
        if (section.name == name) {
            return &section;
        }
    }
    return nullptr;
}

std::optional<std::string> SolutionModel::property(const std::string& key) const {
    const SolutionSection* section = find_global_section("SolutionProperties");
    if (!section) {
        return std::nullopt;
    }
    const PropertyEntry* entry = section->find(key);
    if (!entry) {
        return std::nullopt;
    }
    return entry->value;
}

std::string SolutionModel::header_property(const std::string& key) const {
    for (const auto& entry : header_properties) {
        if (iequals(entry.key, key)) {
            return entry.value;
        }
    }
    return "";
}

std::string SolutionModel::visual_studio_version() const {
    // "12.0.20311.0 VSPRO_PLATFORM": the version is the first word
    std::istringstream words(header_property("VisualStudioVersion"));
    std::string version;
    words >> version;
    return version;
}

int SolutionModel::visual_studio_major_version() const {
    std::string version = visual_studio_version();
    if (!version.empty()) {
        try {
            return std::stoi(version.substr(0, version.find('.')));
        } catch (const std::exception&) {
            // Fall through to the format version
        }
    }
    return format_major > 0 ? format_major - 1 : 0;
}

std::string SolutionModel::default_configuration_name() const {
    for (const auto& config : configurations) {
        if (iequals(config.configuration, "Debug")) {
            return config.configuration;
        }
    }
    return configurations.empty() ? "" : configurations.front().configuration;
}

std::string SolutionModel::default_platform_name() const {
    for (const char* preferred : {"Mixed Platforms", "Any CPU"}) {
        for (const auto& config : configurations) {
            if (iequals(config.platform, preferred)) {
                return config.platform;
            }
        }
    }
    return configurations.empty() ? "" : configurations.front().platform;
}

bool SolutionModel::contains_web_projects() const {
    return std::any_of(projects.begin(), projects.end(), [](const ProjectEntry& proj) {
        return proj.type == ProjectType::WebProject;
    });
}

} // namespace slnmodel
