#pragma once

#include "common/parse_error.hpp"
#include <string>
#include <vector>

namespace slnmodel {

// Collects warnings and parser comments for one parse.
// Warnings are formatted "file(line): warning: message".
class Diagnostics {
public:
    Diagnostics(const std::string& file, bool echo_warnings)
        : m_file(file), m_echo(echo_warnings) {}

    void warning(int line, const std::string& message);
    void comment(const std::string& message);

    // Build (not throw) a fatal error so call sites read "throw diag.error(...)"
    SolutionParseError error(int line, const std::string& message,
                             const std::string& token = "") const {
        return SolutionParseError(m_file, line, message, token);
    }

    const std::string& file() const { return m_file; }
    const std::vector<std::string>& warnings() const { return m_warnings; }
    const std::vector<std::string>& comments() const { return m_comments; }

private:
    std::string m_file;
    bool m_echo;
    std::vector<std::string> m_warnings;
    std::vector<std::string> m_comments;
};

} // namespace slnmodel
