#include "pch.h"
#include "diagnostics.hpp"

namespace slnmodel {

void Diagnostics::warning(int line, const std::string& message) {
    std::string full_message = m_file + "(" + std::to_string(line) + "): warning: " + message;
    if (m_echo) {
        std::cerr << full_message << "\n";
    }
    m_warnings.push_back(full_message);
}

void Diagnostics::comment(const std::string& message) {
#ifndef NDEBUG
    if (m_echo) {
        std::cout << "[DEBUG] " << m_file << ": " << message << "\n";
    }
#endif
    m_comments.push_back(message);
}

} // namespace slnmodel
