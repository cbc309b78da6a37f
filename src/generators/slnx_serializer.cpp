#include "pch.h"
#include "slnx_serializer.hpp"
#include "common/diagnostics.hpp"
#include "common/path_normalizer.hpp"
#include "parsers/block_parser.hpp"
#include "parsers/dependency_resolver.hpp"
#include "parsers/solution_builder.hpp"
#include "pugixml.hpp"
#include <cstring>

namespace slnmodel {

namespace {

const char* const kSolutionItems = "SolutionItems";
const char* const kAllConfigurations = "*|*";

PropertyEntry make_entry(const std::string& key, const std::string& value) {
    PropertyEntry entry;
    entry.key = key;
    entry.value = value;
    entry.raw_value = value;
    return entry;
}

// "fae04ec0-301f-11d3-bf4b-00c04f79efbc" -> "{FAE04EC0-301F-11D3-BF4B-00C04F79EFBC}"
std::string normalize_type_guid(const std::string& type) {
    if (type.empty()) return type;
    std::string guid = type.front() == '{' ? type : "{" + type + "}";
    return to_upper(guid);
}

std::string type_from_extension(const std::string& path) {
    namespace g = project_type_guids;

    if (!path.empty() && (path.back() == '/' || path.back() == '\\')) {
        return g::WebProject;
    }

    static const std::map<std::string, const char*> by_extension = {
        {".csproj", g::CSharp},
        {".vbproj", g::VisualBasic},
        {".fsproj", g::FSharp},
        {".vcxproj", g::VisualCpp},
        {".vcproj", g::VisualCpp},
        {".sqlproj", g::Database},
        {".dbproj", g::Database},
        {".shproj", g::SharedProject},
        {".wdproj", g::WebDeployment},
    };

    auto it = by_extension.find(path_extension(path));
    return it == by_extension.end() ? "" : it->second;
}

SectionOrder order_from_scope(const std::string& scope, bool project_level) {
    bool post = scope == "PostLoad";
    if (project_level) {
        return post ? SectionOrder::PostProject : SectionOrder::PreProject;
    }
    return post ? SectionOrder::PostSolution : SectionOrder::PreSolution;
}

const char* scope_from_order(SectionOrder order) {
    return (order == SectionOrder::PostProject || order == SectionOrder::PostSolution) ? "PostLoad" : "PreLoad";
}

bool is_named(const pugi::xml_node& node, const char* name) {
    return std::strcmp(node.name(), name) == 0;
}

// Per-project configuration elements, keyed by solution configuration
struct ConfigElements {
    std::string build_type;
    std::string platform;
    bool has_build_type = false;
    bool has_platform = false;
    bool build = true;
};

struct PendingProject {
    size_t block_index = 0;
    bool folder = false;
    std::vector<std::string> dependency_refs;
    std::vector<std::string> config_order;
    std::map<std::string, ConfigElements> configs;
};

// Turns a <Solution> element into the raw blocks the model builder consumes
class SlnxLowering {
public:
    SlnxLowering(const std::string& path, Diagnostics& diag) : m_path(path), m_diag(diag) {}

    RawDocument lower(const pugi::xml_node& root);

private:
    std::string folder_guid(const std::string& folder_path);
    void lower_folder(const pugi::xml_node& node);
    void lower_project(const pugi::xml_node& node, const std::string& parent_guid);
    RawBlock lower_properties(const pugi::xml_node& node, bool project_level) const;
    void lower_configurations(const pugi::xml_node& node);
    void finish();

    RawBlock& add_block(const std::string& type, const std::string& name, const std::string& path,
                        const std::string& guid, const std::string& parent_guid, bool folder);

    std::string m_path;
    Diagnostics& m_diag;
    RawDocument m_doc;

    std::vector<std::string> m_build_types;
    std::vector<std::string> m_platforms;
    std::vector<PendingProject> m_pending;
    std::map<std::string, std::string> m_declared_folders;  // "/A/B/" -> Id
    std::map<std::string, std::string> m_created_folders;   // "/A/B/" -> guid in use
    std::vector<std::pair<std::string, std::string>> m_nesting;
};

RawBlock& SlnxLowering::add_block(const std::string& type, const std::string& name, const std::string& path,
                                  const std::string& guid, const std::string& parent_guid, bool folder) {
    RawBlock block;
    block.kind = BlockKind::Project;
    block.header_fields = {type, name, path, guid};
    m_doc.projects.push_back(std::move(block));

    PendingProject pending;
    pending.block_index = m_doc.projects.size() - 1;
    pending.folder = folder;
    m_pending.push_back(std::move(pending));

    if (!parent_guid.empty()) {
        m_nesting.emplace_back(guid, parent_guid);
    }
    return m_doc.projects.back();
}

std::string SlnxLowering::folder_guid(const std::string& folder_path) {
    auto created = m_created_folders.find(folder_path);
    if (created != m_created_folders.end()) {
        return created->second;
    }

    // "/A/B/" -> name "B", parent "/A/"
    std::string inner = folder_path.substr(1, folder_path.size() - 2);
    size_t slash = inner.rfind('/');
    std::string name = slash == std::string::npos ? inner : inner.substr(slash + 1);
    std::string parent_guid;
    if (slash != std::string::npos) {
        parent_guid = folder_guid("/" + inner.substr(0, slash + 1));
    }

    auto declared = m_declared_folders.find(folder_path);
    std::string guid = declared != m_declared_folders.end() ? declared->second : generate_guid();
    m_created_folders[folder_path] = guid;

    add_block(project_type_guids::SolutionFolder, name, name, guid, parent_guid, true);
    return guid;
}

RawBlock SlnxLowering::lower_properties(const pugi::xml_node& node, bool project_level) const {
    RawBlock section;
    section.kind = project_level ? BlockKind::ProjectSection : BlockKind::GlobalSection;
    section.name = node.attribute("Name").as_string();
    section.order = order_from_scope(node.attribute("Scope").as_string(), project_level);

    if (section.name.empty()) {
        throw SerializerError(m_path, "<Properties> element without Name");
    }

    for (pugi::xml_node prop : node.children("Property")) {
        PropertyEntry entry;
        entry.key = prop.attribute("Name").as_string();
        entry.value = prop.attribute("Value").as_string();
        entry.has_separator = static_cast<bool>(prop.attribute("Value"));
        section.entries.push_back(std::move(entry));
    }
    return section;
}

void SlnxLowering::lower_folder(const pugi::xml_node& node) {
    std::string folder_path = node.attribute("Name").as_string();
    std::string guid = folder_guid(folder_path);

    RawBlock* block = nullptr;
    for (auto& pending : m_pending) {
        if (pending.folder && m_doc.projects[pending.block_index].header_fields[3] == guid) {
            block = &m_doc.projects[pending.block_index];
        }
    }

    RawBlock items;
    items.kind = BlockKind::ProjectSection;
    items.name = kSolutionItems;
    items.order = SectionOrder::PreProject;

    std::vector<RawBlock> sections;
    for (pugi::xml_node child : node.children()) {
        if (is_named(child, "File")) {
            std::string file = child.attribute("Path").as_string();
            items.entries.push_back(make_entry(file, file));
        } else if (is_named(child, "Properties")) {
            sections.push_back(lower_properties(child, true));
        }
    }

    if (!items.entries.empty()) {
        block->children.push_back(std::move(items));
    }
    for (auto& section : sections) {
        block->children.push_back(std::move(section));
    }

    // Nested projects come after their folder, in document order
    for (pugi::xml_node child : node.children("Project")) {
        lower_project(child, guid);
    }
}

void SlnxLowering::lower_project(const pugi::xml_node& node, const std::string& parent_guid) {
    std::string path = node.attribute("Path").as_string();
    if (path.empty()) {
        throw SerializerError(m_path, "<Project> element without Path");
    }

    std::string guid = node.attribute("Id") ? node.attribute("Id").as_string() : generate_guid();
    std::string type = node.attribute("Type") ? normalize_type_guid(node.attribute("Type").as_string())
                                              : type_from_extension(path);
    std::string name = node.attribute("DisplayName") ? node.attribute("DisplayName").as_string()
                                                     : path_stem(path);

    RawBlock& block = add_block(type, name, path, guid, parent_guid, false);
    PendingProject& pending = m_pending.back();

    for (pugi::xml_node child : node.children()) {
        if (is_named(child, "BuildDependency")) {
            pending.dependency_refs.push_back(child.attribute("Project").as_string());
        } else if (is_named(child, "BuildType") || is_named(child, "Platform") || is_named(child, "Build")) {
            std::string solution_config = child.attribute("Solution").as_string();
            if (!pending.configs.count(solution_config)) {
                pending.config_order.push_back(solution_config);
            }
            ConfigElements& config = pending.configs[solution_config];
            std::string value = child.attribute("Project").as_string();
            if (is_named(child, "BuildType")) {
                config.build_type = value;
                config.has_build_type = true;
            } else if (is_named(child, "Platform")) {
                config.platform = value;
                config.has_platform = true;
            } else {
                config.build = value != "false";
            }
        } else if (is_named(child, "Properties")) {
            block.children.push_back(lower_properties(child, true));
        }
    }
}

void SlnxLowering::lower_configurations(const pugi::xml_node& node) {
    for (pugi::xml_node build_type : node.children("BuildType")) {
        m_build_types.push_back(build_type.attribute("Name").as_string());
    }
    for (pugi::xml_node platform : node.children("Platform")) {
        m_platforms.push_back(platform.attribute("Name").as_string());
    }
}

void SlnxLowering::finish() {
    RawBlock solution_configs;
    solution_configs.kind = BlockKind::GlobalSection;
    solution_configs.name = "SolutionConfigurationPlatforms";
    solution_configs.order = SectionOrder::PreSolution;

    std::vector<std::string> all_configs;
    for (const auto& build_type : m_build_types) {
        for (const auto& platform : m_platforms) {
            std::string full = build_type + "|" + platform;
            all_configs.push_back(full);
            solution_configs.entries.push_back(make_entry(full, full));
        }
    }

    RawBlock project_configs;
    project_configs.kind = BlockKind::GlobalSection;
    project_configs.name = "ProjectConfigurationPlatforms";
    project_configs.order = SectionOrder::PostSolution;

    // Path -> guid for resolving BuildDependency references
    std::map<std::string, std::string, CaseInsensitiveLess> guid_by_path;
    for (const auto& pending : m_pending) {
        const RawBlock& block = m_doc.projects[pending.block_index];
        if (!pending.folder) {
            guid_by_path.emplace(block.header_fields[2], block.header_fields[3]);
        }
    }

    for (const auto& pending : m_pending) {
        RawBlock& block = m_doc.projects[pending.block_index];
        if (pending.folder) {
            continue;
        }
        const std::string& guid = block.header_fields[3];

        if (pending.configs.empty()) {
            // No explicit mapping: every solution configuration maps to itself
            for (const auto& full : all_configs) {
                project_configs.entries.push_back(make_entry(guid + "." + full + ".ActiveCfg", full));
                project_configs.entries.push_back(make_entry(guid + "." + full + ".Build.0", full));
            }
        } else {
            for (const auto& full : pending.config_order) {
                // "*|*" excludes the project from every configuration
                if (full == kAllConfigurations) {
                    continue;
                }
                const ConfigElements& config = pending.configs.at(full);
                size_t bar = full.find('|');
                std::string build_type = config.build_type;
                std::string platform = config.platform;
                if (!config.has_build_type) {
                    // A lone <Build> or <Platform> keeps the solution's own names
                    build_type = full.substr(0, bar);
                    if (!config.has_platform && bar != std::string::npos) {
                        platform = full.substr(bar + 1);
                    }
                }
                std::string value = platform.empty() ? build_type : build_type + "|" + platform;

                project_configs.entries.push_back(make_entry(guid + "." + full + ".ActiveCfg", value));
                if (config.build) {
                    project_configs.entries.push_back(make_entry(guid + "." + full + ".Build.0", value));
                }
            }
        }

        if (!pending.dependency_refs.empty()) {
            RawBlock deps;
            deps.kind = BlockKind::ProjectSection;
            deps.name = "ProjectDependencies";
            deps.order = SectionOrder::PostProject;
            for (const auto& ref : pending.dependency_refs) {
                auto it = guid_by_path.find(ref);
                if (it != guid_by_path.end()) {
                    deps.entries.push_back(make_entry(it->second, it->second));
                } else if (DependencyResolver::is_braced_guid(ref)) {
                    deps.entries.push_back(make_entry(ref, ref));
                } else {
                    m_diag.warning(0, "build dependency '" + ref + "' does not name a project in this solution");
                }
            }
            block.children.push_back(std::move(deps));
        }
    }

    RawBlock nested;
    nested.kind = BlockKind::GlobalSection;
    nested.name = "NestedProjects";
    nested.order = SectionOrder::PreSolution;
    for (const auto& [child, parent] : m_nesting) {
        nested.entries.push_back(make_entry(child, parent));
    }

    m_doc.global_sections.insert(m_doc.global_sections.begin(), std::move(project_configs));
    m_doc.global_sections.insert(m_doc.global_sections.begin(), std::move(solution_configs));
    m_doc.global_sections.push_back(std::move(nested));
    m_doc.has_global = true;
}

RawDocument SlnxLowering::lower(const pugi::xml_node& root) {
    m_doc.file = m_path;
    m_doc.format_version = "12.00";
    m_doc.format_major = 12;

    // Folder ids first, so a child folder listed before its parent still nests correctly
    for (pugi::xml_node folder : root.children("Folder")) {
        std::string name = folder.attribute("Name").as_string();
        if (name.size() < 3 || name.front() != '/' || name.back() != '/') {
            throw SerializerError(m_path, "folder name must look like /Name/, got '" + name + "'");
        }
        if (folder.attribute("Id")) {
            m_declared_folders[name] = folder.attribute("Id").as_string();
        }
    }

    for (pugi::xml_node child : root.children()) {
        if (is_named(child, "Configurations")) {
            lower_configurations(child);
        } else if (is_named(child, "Folder")) {
            lower_folder(child);
        } else if (is_named(child, "Project")) {
            lower_project(child, "");
        } else if (is_named(child, "Properties")) {
            m_doc.global_sections.push_back(lower_properties(child, false));
        }
    }

    finish();
    return m_doc;
}

void write_properties(pugi::xml_node parent, const SolutionSection& section) {
    auto props = parent.append_child("Properties");
    props.append_attribute("Name") = section.name.c_str();
    props.append_attribute("Scope") = scope_from_order(section.order);
    for (const auto& entry : section.entries) {
        auto prop = props.append_child("Property");
        prop.append_attribute("Name") = entry.key.c_str();
        if (entry.has_separator) {
            prop.append_attribute("Value") = entry.value.c_str();
        }
    }
}

} // namespace

SolutionModel SlnxSerializer::open(const std::string& path, const ParseOptions& options,
                                   const CancellationToken& token) {
    token.throw_if_cancelled(path);

    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (result.status == pugi::status_file_not_found || result.status == pugi::status_io_error) {
        throw SerializerError(path, "cannot open solution file");
    }
    if (!result) {
        throw SerializerError(path, std::string("invalid XML: ") + result.description());
    }

    pugi::xml_node root = doc.child("Solution");
    if (!root) {
        throw SerializerError(path, "missing <Solution> root element");
    }

    token.throw_if_cancelled(path);

    Diagnostics diagnostics(path, options.echo_warnings);
    SlnxLowering lowering(path, diagnostics);
    RawDocument document = lowering.lower(root);

    SolutionBuilder builder(options, diagnostics);
    return builder.build(document);
}

void SlnxSerializer::save(const std::string& path, const SolutionModel& model, const ParseOptions&) {
    pugi::xml_document doc;

    // XML declaration
    auto decl = doc.prepend_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("Solution");

    // Configurations section: the solution list is rebuilt as BuildType x Platform
    if (!model.configurations.empty()) {
        auto configs = root.append_child("Configurations");
        std::vector<std::string> build_types, platforms;
        for (const auto& config : model.configurations) {
            if (std::find(build_types.begin(), build_types.end(), config.configuration) == build_types.end()) {
                build_types.push_back(config.configuration);
            }
            if (std::find(platforms.begin(), platforms.end(), config.platform) == platforms.end()) {
                platforms.push_back(config.platform);
            }
        }
        for (const auto& build_type : build_types) {
            configs.append_child("BuildType").append_attribute("Name") = build_type.c_str();
        }
        for (const auto& platform : platforms) {
            configs.append_child("Platform").append_attribute("Name") = platform.c_str();
        }
    }

    // Folders are flat, named by their full virtual path
    std::map<std::string, pugi::xml_node, CaseInsensitiveLess> folder_nodes;
    for (const auto& proj : model.projects) {
        if (!proj.is_folder()) {
            continue;
        }
        auto folder = root.append_child("Folder");
        folder.append_attribute("Name") = proj.display_path.c_str();
        folder.append_attribute("Id") = proj.guid.c_str();
        for (const auto& section : proj.sections) {
            if (section.name == kSolutionItems) {
                for (const auto& entry : section.entries) {
                    folder.append_child("File").append_attribute("Path") = entry.key.c_str();
                }
            } else {
                write_properties(folder, section);
            }
        }
        folder_nodes[proj.guid] = folder;
    }

    // Dependencies are written by path when the path is unambiguous
    std::map<std::string, int, CaseInsensitiveLess> path_uses;
    for (const auto& proj : model.projects) {
        if (!proj.is_folder()) {
            path_uses[proj.relative_path]++;
        }
    }

    for (const auto& proj : model.projects) {
        if (proj.is_folder()) {
            continue;
        }

        pugi::xml_node parent = root;
        if (proj.parent_guid) {
            parent = folder_nodes[*proj.parent_guid];
        }

        auto project = parent.append_child("Project");
        project.append_attribute("Path") = proj.relative_path.c_str();
        project.append_attribute("Id") = proj.guid.c_str();
        if (!proj.type_guid.empty()) {
            project.append_attribute("Type") = to_lower(strip_braces(proj.type_guid)).c_str();
        }
        if (proj.name != path_stem(proj.relative_path)) {
            project.append_attribute("DisplayName") = proj.name.c_str();
        }

        for (const auto& dep : proj.dependencies) {
            const ProjectEntry* target = model.find_project(dep);
            std::string ref = dep;
            if (target && !target->is_folder() && path_uses[target->relative_path] == 1) {
                ref = target->relative_path;
            }
            project.append_child("BuildDependency").append_attribute("Project") = ref.c_str();
        }

        // Without any element the reader maps every configuration to itself
        if (proj.configurations.empty() && !model.configurations.empty()) {
            auto build = project.append_child("Build");
            build.append_attribute("Solution") = kAllConfigurations;
            build.append_attribute("Project") = "false";
        }

        for (const auto& config : model.configurations) {
            const ProjectConfiguration* mapped = proj.configuration_for(config.full_name());
            if (!mapped) {
                continue;
            }
            std::string solution_config = config.full_name();

            auto build_type = project.append_child("BuildType");
            build_type.append_attribute("Solution") = solution_config.c_str();
            build_type.append_attribute("Project") = mapped->configuration.c_str();

            if (!mapped->platform.empty()) {
                auto platform = project.append_child("Platform");
                platform.append_attribute("Solution") = solution_config.c_str();
                platform.append_attribute("Project") = mapped->platform.c_str();
            }

            if (!mapped->build) {
                auto build = project.append_child("Build");
                build.append_attribute("Solution") = solution_config.c_str();
                build.append_attribute("Project") = "false";
            }
        }

        for (const auto& section : proj.sections) {
            write_properties(project, section);
        }
    }

    for (const auto& section : model.global_sections) {
        write_properties(root, section);
    }

    // Save to file with tab indentation
    if (!doc.save_file(path.c_str(), "\t", pugi::format_default)) {
        throw SerializerError(path, "cannot write solution file");
    }
}

bool SlnxSerializer::recognizes(const std::string& head) const {
    size_t start = head.find_first_not_of(" \t\r\n");
    if (start != std::string::npos && head.compare(start, 3, "\xEF\xBB\xBF") == 0) {
        start = head.find_first_not_of(" \t\r\n", start + 3);
    }
    return start != std::string::npos && head[start] == '<' && head.find("<Solution") != std::string::npos;
}

} // namespace slnmodel
