#pragma once

#include <string>
#include <vector>

namespace slnmodel {

// A trimmed, non-blank source line with its 1-based physical line number
struct ScannedLine {
    std::string text;
    int line = 0;
};

struct ScanResult {
    std::vector<ScannedLine> lines;     // Logical lines, comments removed
    std::vector<ScannedLine> comments;  // Comment lines, marker and whitespace stripped
};

// Splits descriptor text into logical lines.
// Strips a leading UTF-8 BOM, trims each line and sets aside full-line comments.
class LineScanner {
public:
    explicit LineScanner(char comment_char = '#') : m_comment_char(comment_char) {}

    ScanResult scan(const std::string& content) const;

    static std::string trim(const std::string& str);

private:
    char m_comment_char;
};

} // namespace slnmodel
