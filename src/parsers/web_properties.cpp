#include "pch.h"
#include "web_properties.hpp"

namespace slnmodel {

namespace {

const std::string kCompilerNamespace = "AspNetCompiler.";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

bool WebPropertyExtractor::assign_field(WebCompilerParameters& params, const std::string& field,
                                        const std::string& value) {
    static const std::map<std::string, std::string WebCompilerParameters::*> fields = {
        {"VirtualPath", &WebCompilerParameters::virtual_path},
        {"PhysicalPath", &WebCompilerParameters::physical_path},
        {"TargetPath", &WebCompilerParameters::target_path},
        {"ForceOverwrite", &WebCompilerParameters::force_overwrite},
        {"Updateable", &WebCompilerParameters::updateable},
        {"Debug", &WebCompilerParameters::debug},
        {"KeyFile", &WebCompilerParameters::key_file},
        {"KeyContainer", &WebCompilerParameters::key_container},
        {"DelaySign", &WebCompilerParameters::delay_sign},
        {"AllowPartiallyTrustedCallers", &WebCompilerParameters::allow_partially_trusted_callers},
        {"FixedNames", &WebCompilerParameters::fixed_names},
    };

    auto it = fields.find(field);
    if (it == fields.end()) {
        return false;
    }
    params.*(it->second) = value;
    return true;
}

std::map<std::string, WebCompilerParameters> WebPropertyExtractor::extract(
    const std::vector<PropertyEntry>& entries) const {
    std::map<std::string, WebCompilerParameters> configurations;

    for (const auto& entry : entries) {
        size_t dot = entry.key.find('.');
        if (dot == std::string::npos || dot == 0) {
            continue;
        }

        std::string config_name = entry.key.substr(0, dot);
        std::string rest = entry.key.substr(dot + 1);

        WebCompilerParameters& params = configurations[config_name];
        if (rest.compare(0, kCompilerNamespace.size(), kCompilerNamespace) == 0) {
            assign_field(params, rest.substr(kCompilerNamespace.size()), entry.value);
        }
    }

    return configurations;
}

std::string WebPropertyExtractor::target_framework_moniker(const std::vector<PropertyEntry>& entries) const {
    for (const auto& entry : entries) {
        if (iequals(entry.key, "TargetFrameworkMoniker")) {
            return unescape(entry.value);
        }
    }
    return "";
}

std::string WebPropertyExtractor::unescape(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            int hi = hex_value(value[i + 1]);
            int lo = hex_value(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        result += value[i];
    }
    return result;
}

} // namespace slnmodel
