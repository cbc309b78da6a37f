#include "pch.h"
#include "sln_writer.hpp"

namespace slnmodel {

std::string SlnWriter::quote(const std::string& value) const {
    std::string result(1, m_quote);
    for (char c : value) {
        result += c;
        if (c == m_quote) {
            result += m_quote;
        }
    }
    result += m_quote;
    return result;
}

void SlnWriter::write_section(std::ostream& out, const char* keyword, const SolutionSection& section) const {
    out << "\t" << keyword << "(" << section.name << ") = " << section_order_to_string(section.order) << "\n";
    for (const auto& entry : section.entries) {
        if (!entry.has_separator) {
            out << "\t\t" << entry.key << "\n";
            continue;
        }

        // Models built from the structured format carry decoded values only
        std::string value = entry.raw_value;
        if (value.empty() && !entry.value.empty()) {
            bool looks_quoted = entry.value.front() == m_quote || entry.value.back() == m_quote;
            value = looks_quoted ? quote(entry.value) : entry.value;
        }
        out << "\t\t" << entry.key << " = " << value << "\n";
    }
    out << "\tEnd" << keyword << "\n";
}

void SlnWriter::write_project(std::ostream& out, const ProjectEntry& proj) const {
    out << "Project(" << quote(proj.type_guid) << ") = " << quote(proj.name) << ", "
        << quote(proj.relative_path) << ", " << quote(proj.guid) << "\n";

    for (const auto& section : proj.sections) {
        write_section(out, "ProjectSection", section);
    }

    if (!proj.dependencies.empty()) {
        out << "\tProjectSection(ProjectDependencies) = postProject\n";
        for (const auto& dep : proj.dependencies) {
            out << "\t\t" << dep << " = " << dep << "\n";
        }
        out << "\tEndProjectSection\n";
    }

    out << "EndProject\n";
}

void SlnWriter::write(std::ostream& out, const SolutionModel& model) const {
    // Header
    out << "\xEF\xBB\xBF\n"; // UTF-8 BOM
    out << "Microsoft Visual Studio Solution File, Format Version "
        << (model.format_version.empty() ? "12.00" : model.format_version) << "\n";
    if (!model.product_description.empty()) {
        out << "# " << model.product_description << "\n";
    }
    for (const auto& prop : model.header_properties) {
        out << prop.key << " = " << (prop.raw_value.empty() ? prop.value : prop.raw_value) << "\n";
    }

    // Projects
    for (const auto& proj : model.projects) {
        write_project(out, proj);
    }

    // Global section
    out << "Global\n";

    if (!model.configurations.empty()) {
        out << "\tGlobalSection(SolutionConfigurationPlatforms) = preSolution\n";
        for (const auto& config : model.configurations) {
            out << "\t\t" << config.full_name() << " = " << config.full_name() << "\n";
        }
        out << "\tEndGlobalSection\n";

        out << "\tGlobalSection(ProjectConfigurationPlatforms) = postSolution\n";
        for (const auto& proj : model.projects) {
            for (const auto& config : model.configurations) {
                const ProjectConfiguration* mapped = proj.configuration_for(config.full_name());
                if (!mapped) {
                    continue;
                }

                ProjectConfiguration written = *mapped;
                if (written.platform == "AnyCPU") {
                    written.platform = "Any CPU";
                }

                std::string key = proj.guid + "." + config.full_name();
                out << "\t\t" << key << ".ActiveCfg = " << written.full_name() << "\n";
                if (mapped->build) {
                    out << "\t\t" << key << ".Build.0 = " << written.full_name() << "\n";
                }
            }
        }
        out << "\tEndGlobalSection\n";
    }

    for (const auto& section : model.global_sections) {
        write_section(out, "GlobalSection", section);
    }

    bool has_nesting = std::any_of(model.projects.begin(), model.projects.end(),
                                   [](const ProjectEntry& proj) { return proj.parent_guid.has_value(); });
    if (has_nesting) {
        out << "\tGlobalSection(NestedProjects) = preSolution\n";
        for (const auto& proj : model.projects) {
            if (proj.parent_guid) {
                out << "\t\t" << proj.guid << " = " << *proj.parent_guid << "\n";
            }
        }
        out << "\tEndGlobalSection\n";
    }

    out << "EndGlobal\n";
}

std::string SlnWriter::write_string(const SolutionModel& model) const {
    std::ostringstream out;
    write(out, model);
    return out.str();
}

bool SlnWriter::write_sln(const SolutionModel& model, const std::string& output_path) const {
    std::ofstream file(output_path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    write(file, model);
    file.close();
    return !file.fail();
}

} // namespace slnmodel
