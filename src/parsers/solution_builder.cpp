#include "pch.h"
#include "solution_builder.hpp"
#include "common/path_normalizer.hpp"
#include "configuration_mapper.hpp"
#include "dependency_resolver.hpp"
#include "line_scanner.hpp"
#include "web_properties.hpp"
#include <functional>

namespace slnmodel {

namespace {

const std::string kDependenciesSection = "ProjectDependencies";
const std::string kWebsiteSection = "WebsiteProperties";
const std::string kSolutionConfigsSection = "SolutionConfigurationPlatforms";
const std::string kProjectConfigsSection = "ProjectConfigurationPlatforms";
const std::string kNestedProjectsSection = "NestedProjects";

} // namespace

std::string SolutionBuilder::cleanse_name(const std::string& name) {
    std::string result = name;
    for (char& c : result) {
        if (std::string("%$@;.()'").find(c) != std::string::npos) {
            c = '_';
        }
    }
    return result;
}

ProjectEntry SolutionBuilder::build_entry(const RawBlock& block) {
    ProjectEntry entry;
    entry.line = block.line;
    entry.type_guid = LineScanner::trim(block.header_fields[0]);
    entry.name = LineScanner::trim(block.header_fields[1]);
    entry.relative_path = LineScanner::trim(block.header_fields[2]);
    entry.guid = LineScanner::trim(block.header_fields[3]);

    if (entry.guid.empty()) {
        throw m_diag.error(block.line, "project identifier is empty", entry.name);
    }
    if (entry.relative_path.empty()) {
        throw m_diag.error(block.line, "project path is empty", entry.name);
    }
    if (has_invalid_path_chars(entry.relative_path)) {
        throw m_diag.error(block.line, "project path contains invalid characters", entry.relative_path);
    }
    if (entry.name.empty()) {
        entry.name = "EmptyProjectName." + strip_braces(generate_guid());
    }

    entry.type = classify_project_type(entry.type_guid);
    if (iequals(entry.type_guid, project_type_guids::VisualCpp) &&
        path_extension(entry.relative_path) == ".vcproj" && !m_options.for_conversion) {
        throw m_diag.error(block.line, "Visual C++ project must be upgraded to .vcxproj before it can be loaded",
                           entry.relative_path);
    }
    if (entry.type == ProjectType::Unknown) {
        m_diag.comment("project '" + entry.name + "' has unrecognized type " + entry.type_guid);
    }

    // URLs of web projects are not file paths
    if (m_options.normalize_paths && !entry.is_folder() &&
        entry.relative_path.find("://") == std::string::npos) {
        entry.relative_path = normalize_path(entry.relative_path);
    }

    DependencyResolver resolver(m_diag);
    WebPropertyExtractor extractor;

    for (const auto& child : block.children) {
        if (iequals(child.name, kDependenciesSection)) {
            std::vector<std::string> deps = resolver.resolve_dependencies(child.entries);
            entry.dependencies.insert(entry.dependencies.end(), deps.begin(), deps.end());
            continue;
        }

        if (child.name == kWebsiteSection) {
            entry.web_configurations = extractor.extract(child.entries);
            entry.target_framework_moniker = extractor.target_framework_moniker(child.entries);
            for (const auto& prop : child.entries) {
                if (iequals(prop.key, "ProjectReferences")) {
                    entry.project_references = resolver.resolve_references(prop.value, prop.line);
                }
            }
        }

        SolutionSection section;
        section.name = child.name;
        section.order = child.order.value_or(SectionOrder::PreProject);
        section.entries = child.entries;
        section.line = child.line;
        entry.sections.push_back(std::move(section));
    }

    return entry;
}

void SolutionBuilder::apply_nesting(const std::vector<PropertyEntry>& entries, SolutionModel& model) {
    std::map<std::string, size_t, CaseInsensitiveLess> index;
    for (size_t i = 0; i < model.projects.size(); ++i) {
        index[model.projects[i].guid] = i;
    }

    std::map<size_t, int> nesting_line;
    for (const auto& entry : entries) {
        if (!entry.has_separator) {
            throw m_diag.error(entry.line, "NestedProjects entry must be child = parent", entry.key);
        }

        auto child = index.find(entry.key);
        if (child == index.end()) {
            throw m_diag.error(entry.line, "nested project is not declared in this solution", entry.key);
        }
        auto parent = index.find(entry.value);
        if (parent == index.end()) {
            throw m_diag.error(entry.line, "parent of nested project is not declared in this solution", entry.value);
        }
        if (!model.projects[parent->second].is_folder()) {
            throw m_diag.error(entry.line, "parent of nested project is not a solution folder", entry.value);
        }

        model.projects[child->second].parent_guid = model.projects[parent->second].guid;
        nesting_line[child->second] = entry.line;
    }

    // Each parent chain must end at a top-level entry
    for (const auto& [start, line] : nesting_line) {
        size_t current = start;
        for (size_t steps = 0; model.projects[current].parent_guid; ++steps) {
            current = index[*model.projects[current].parent_guid];
            if (current == start || steps > model.projects.size()) {
                throw m_diag.error(line, "solution folders are nested in a cycle", model.projects[start].guid);
            }
        }
    }
}

void SolutionBuilder::assign_unique_names(SolutionModel& model) {
    auto& projects = model.projects;

    std::map<std::string, size_t, CaseInsensitiveLess> index;
    for (size_t i = 0; i < projects.size(); ++i) {
        index[projects[i].guid] = i;
    }

    // MySlnFolder\MySubSlnFolder\ClassLibrary2
    std::vector<std::optional<std::string>> base(projects.size());
    std::function<std::string(size_t)> base_name = [&](size_t i) -> std::string {
        if (!base[i]) {
            std::string name = cleanse_name(projects[i].name);
            if (projects[i].parent_guid) {
                name = base_name(index[*projects[i].parent_guid]) + "\\" + name;
            }
            base[i] = name;
        }
        return *base[i];
    };

    auto with_guid = [&](size_t i, const std::string& name) {
        return name + "_" + strip_braces(projects[i].guid);
    };
    auto altered = [&](size_t i) {
        return cleanse_name(projects[i].name) != projects[i].name;
    };

    std::map<std::string, size_t, CaseInsensitiveLess> taken;
    for (size_t i = 0; i < projects.size(); ++i) {
        std::string name = base_name(i);

        auto existing = taken.find(name);
        if (existing != taken.end()) {
            size_t other = existing->second;
            if (altered(i)) {
                name = with_guid(i, name);
            } else if (altered(other)) {
                std::string renamed = with_guid(other, projects[other].unique_name);
                taken.erase(existing);
                if (taken.count(renamed)) {
                    throw m_diag.error(projects[other].line, "duplicate project name", renamed);
                }
                projects[other].unique_name = renamed;
                taken[renamed] = other;
            } else {
                throw m_diag.error(projects[i].line, "duplicate project name", name);
            }

            if (taken.count(name)) {
                throw m_diag.error(projects[i].line, "duplicate project name", name);
            }
        }

        projects[i].unique_name = name;
        taken[name] = i;
    }
}

void SolutionBuilder::assign_display_paths(SolutionModel& model) {
    std::map<std::string, const ProjectEntry*, CaseInsensitiveLess> by_guid;
    for (const auto& proj : model.projects) {
        by_guid[proj.guid] = &proj;
    }

    for (auto& proj : model.projects) {
        if (!proj.is_folder()) {
            proj.display_path = proj.relative_path;
            continue;
        }

        // "/Parent/Child/"
        std::string path = proj.name + "/";
        const ProjectEntry* current = &proj;
        while (current->parent_guid) {
            current = by_guid[*current->parent_guid];
            path = current->name + "/" + path;
        }
        proj.display_path = "/" + path;
    }
}

SolutionModel SolutionBuilder::build(const RawDocument& document) {
    SolutionModel model;
    model.path = document.file;
    model.format_version = document.format_version;
    model.format_major = document.format_major;
    model.product_description = document.product_description;
    model.header_properties = document.header_properties;

    std::set<std::string, CaseInsensitiveLess> seen;
    for (const auto& block : document.projects) {
        ProjectEntry entry = build_entry(block);
        if (!seen.insert(entry.guid).second) {
            throw m_diag.error(block.line, "duplicate project identifier", entry.guid);
        }
        model.projects.push_back(std::move(entry));
    }

    std::vector<PropertyEntry> solution_configs;
    std::vector<PropertyEntry> project_configs;
    std::vector<PropertyEntry> nested_projects;
    for (const auto& block : document.global_sections) {
        if (block.name == kSolutionConfigsSection) {
            solution_configs.insert(solution_configs.end(), block.entries.begin(), block.entries.end());
        } else if (block.name == kProjectConfigsSection) {
            project_configs.insert(project_configs.end(), block.entries.begin(), block.entries.end());
        } else if (block.name == kNestedProjectsSection) {
            nested_projects.insert(nested_projects.end(), block.entries.begin(), block.entries.end());
        } else {
            SolutionSection section;
            section.name = block.name;
            section.order = block.order.value_or(SectionOrder::PreSolution);
            section.entries = block.entries;
            section.line = block.line;
            model.global_sections.push_back(std::move(section));
        }
    }

    ConfigurationMapper mapper(m_diag);
    model.configurations = mapper.parse_solution_configurations(solution_configs);
    mapper.map_projects(project_configs, model.configurations, model.projects);

    apply_nesting(nested_projects, model);
    assign_unique_names(model);
    assign_display_paths(model);

    model.warnings = m_diag.warnings();
    model.comments = m_diag.comments();

    return model;
}

} // namespace slnmodel
