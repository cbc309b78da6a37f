#pragma once

#include "common/solution_types.hpp"

namespace slnmodel {

// Decodes "<Config>.AspNetCompiler.<Field> = value" keys of a WebsiteProperties
// section into one WebCompilerParameters record per configuration name.
class WebPropertyExtractor {
public:
    WebPropertyExtractor() = default;

    // Every dotted key creates its configuration's record; unknown fields are ignored
    std::map<std::string, WebCompilerParameters> extract(const std::vector<PropertyEntry>& entries) const;

    // Value of TargetFrameworkMoniker, %XX escapes decoded
    std::string target_framework_moniker(const std::vector<PropertyEntry>& entries) const;

    // "Version%3Dv4.0" -> "Version=v4.0"; malformed escapes are left as written
    static std::string unescape(const std::string& value);

private:
    static bool assign_field(WebCompilerParameters& params, const std::string& field, const std::string& value);
};

} // namespace slnmodel
