#include "pch.h"
#include "line_scanner.hpp"

namespace slnmodel {

std::string LineScanner::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

ScanResult LineScanner::scan(const std::string& content) const {
    ScanResult result;

    size_t pos = 0;
    if (content.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        pos = 3;
    }

    int line_number = 0;
    while (pos <= content.size()) {
        size_t eol = content.find('\n', pos);
        if (eol == std::string::npos) eol = content.size();

        line_number++;
        std::string text = trim(content.substr(pos, eol - pos));
        pos = eol + 1;

        if (text.empty()) {
            continue;
        }

        if (text[0] == m_comment_char) {
            result.comments.push_back({trim(text.substr(1)), line_number});
            continue;
        }

        result.lines.push_back({text, line_number});
    }

    return result;
}

} // namespace slnmodel
