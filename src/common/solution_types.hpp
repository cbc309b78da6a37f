#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace slnmodel {

// Project type GUIDs as written in Project("{...}") headers
namespace project_type_guids {
constexpr const char* VisualBasic   = "{F184B08F-C81C-45F6-A57F-5ABD9991F28F}";
constexpr const char* CSharp        = "{FAE04EC0-301F-11D3-BF4B-00C04F79EFBC}";
constexpr const char* Cps           = "{13B669BE-BB05-4DDF-9536-439F39A36129}";
constexpr const char* CpsCSharp     = "{9A19103F-16F7-4668-BE54-9A1E7A4F7556}";
constexpr const char* CpsVisualBasic = "{778DAE3C-4631-46EA-AA77-85C1314464D9}";
constexpr const char* CpsFSharp     = "{6EC3EE1D-3C4E-46DD-8F32-0CC8E7565705}";
constexpr const char* JSharp        = "{E6FDF86B-F3D1-11D4-8576-0002A516ECE8}";
constexpr const char* VisualCpp     = "{8BC9CEB8-8B4A-11D0-8D11-00A0C91BC942}";
constexpr const char* FSharp        = "{F2A71F9B-5D33-465A-A702-920D77279786}";
constexpr const char* Database      = "{C8D11400-126E-41CD-887F-60BD40844F9E}";
constexpr const char* Synergex      = "{BBD0F5D1-1CC4-42FD-BA4C-A96779C64378}";
constexpr const char* WebDeployment = "{2CFEAB61-6A3B-4EB8-B523-560B4BEEF521}";
constexpr const char* WebProject    = "{E24C65DC-7377-472B-9ABA-BC803B73C61A}";
constexpr const char* SolutionFolder = "{2150E333-8FDC-42A3-9474-1A3956D46DE8}";
constexpr const char* SharedProject = "{D954291E-2A0B-460D-934E-DC6B0785DB48}";
} // namespace project_type_guids

// Logical kind of a solution entry
enum class ProjectType {
    Project,              // Ordinary buildable project (C#, VB, C++, ...)
    SolutionFolder,       // Virtual grouping folder
    WebProject,           // Legacy web site project
    WebDeploymentProject, // Web deployment project
    SharedProject,        // Shared items project
    Unknown               // Unrecognized type token
};

std::string project_type_to_string(ProjectType type);

// Section ordering qualifier: ProjectSection(X) = preProject
enum class SectionOrder {
    PreProject,
    PostProject,
    PreSolution,
    PostSolution
};

std::optional<SectionOrder> parse_section_order(const std::string& text);
std::string section_order_to_string(SectionOrder order);

// Case-insensitive helpers (GUIDs, configuration keys)
inline std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

inline std::string to_upper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

inline bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
            [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
    }
};

// One "key = value" line inside a section
struct PropertyEntry {
    std::string key;
    std::string value;      // Unquoted and unescaped
    std::string raw_value;  // As written in the source
    int line = 0;
    bool has_separator = true;
};

// A ProjectSection or GlobalSection kept as an opaque bag
struct SolutionSection {
    std::string name;
    SectionOrder order = SectionOrder::PreProject;
    std::vector<PropertyEntry> entries;
    int line = 0;

    const PropertyEntry* find(const std::string& key) const;
};

// ASP.NET compiler parameters for one build configuration of a web project
struct WebCompilerParameters {
    std::string virtual_path;
    std::string physical_path;
    std::string target_path;
    std::string force_overwrite;
    std::string updateable;
    std::string debug;
    std::string key_file;
    std::string key_container;
    std::string delay_sign;
    std::string allow_partially_trusted_callers;
    std::string fixed_names;
};

// Website project reference: "{GUID}|File.dll"
struct ProjectReference {
    std::string guid;
    std::string file_name;
};

// Project-level configuration a solution configuration maps to
struct ProjectConfiguration {
    std::string configuration;
    std::string platform;
    bool build = false;

    std::string full_name() const {
        return platform.empty() ? configuration : configuration + "|" + platform;
    }
};

// Solution-level "Debug|Any CPU" pair
struct SolutionConfiguration {
    std::string configuration;
    std::string platform;

    std::string full_name() const { return configuration + "|" + platform; }
};

// One project or solution folder
struct ProjectEntry {
    std::string guid;            // "{...}" as declared
    std::string name;
    std::string relative_path;
    std::string type_guid;
    ProjectType type = ProjectType::Unknown;
    std::optional<std::string> parent_guid;

    std::vector<std::string> dependencies;              // ProjectDependencies, in order
    std::vector<ProjectReference> project_references;   // WebsiteProperties only
    std::map<std::string, WebCompilerParameters> web_configurations;
    std::string target_framework_moniker;

    // Keyed by solution configuration full name ("Debug|Win32")
    std::map<std::string, ProjectConfiguration, CaseInsensitiveLess> configurations;

    std::string unique_name;
    std::string display_path;    // Declared path, or "/Folder/Sub/" for folders
    std::vector<SolutionSection> sections;  // Everything except ProjectDependencies
    int line = 0;

    bool is_folder() const { return type == ProjectType::SolutionFolder; }
    bool is_buildable() const { return !is_folder() && !configurations.empty(); }

    const ProjectConfiguration* configuration_for(const std::string& solution_config) const;
    const SolutionSection* find_section(const std::string& section_name) const;
};

// Parse result for one solution descriptor
struct SolutionModel {
    std::string path;
    std::string format_version;           // "12.00"
    int format_major = 0;
    std::string product_description;      // First comment after the header
    std::vector<PropertyEntry> header_properties;  // VisualStudioVersion etc.

    std::vector<ProjectEntry> projects;   // Declaration order
    std::vector<SolutionConfiguration> configurations;
    std::vector<SolutionSection> global_sections;

    std::vector<std::string> warnings;
    std::vector<std::string> comments;

    const ProjectEntry* find_project(const std::string& guid) const;
    const ProjectEntry* find_project_by_unique_name(const std::string& unique_name) const;
    std::vector<const ProjectEntry*> children_of(const std::string& guid) const;

    const SolutionSection* find_global_section(const std::string& name) const;

    // Value from the SolutionProperties global section
    std::optional<std::string> property(const std::string& key) const;

    std::string header_property(const std::string& key) const;

    // "12.0.20311.0" from "VisualStudioVersion = 12.0.20311.0 VSPRO_PLATFORM"
    std::string visual_studio_version() const;
    int visual_studio_major_version() const;

    std::string default_configuration_name() const;
    std::string default_platform_name() const;

    bool contains_web_projects() const;
};

// Generate a new "{XXXXXXXX-XXXX-4XXX-YXXX-XXXXXXXXXXXX}" GUID.
// Each thread draws from its own engine.
inline std::string generate_guid() {
    thread_local std::random_device rd;
    thread_local std::mt19937 gen(rd());
    thread_local std::uniform_int_distribution<> dis(0, 15);
    thread_local std::uniform_int_distribution<> dis2(8, 11);

    std::stringstream ss;
    ss << std::uppercase << std::hex << "{";
    for (int i = 0; i < 8; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 4; i++) ss << dis(gen);
    ss << "-4";
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-";
    ss << dis2(gen);
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 12; i++) ss << dis(gen);
    ss << "}";

    return ss.str();
}

// "{ABC}" -> "ABC"
inline std::string strip_braces(const std::string& guid) {
    if (guid.size() >= 2 && guid.front() == '{' && guid.back() == '}') {
        return guid.substr(1, guid.size() - 2);
    }
    return guid;
}

// Classify a project type token; .vcproj handling is the builder's job
ProjectType classify_project_type(const std::string& type_guid);

} // namespace slnmodel
