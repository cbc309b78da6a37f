#include "pch.h"
#include "path_normalizer.hpp"

namespace fs = std::filesystem;

namespace slnmodel {

std::string to_host_separators(const std::string& path) {
    std::string result = path;
    const char preferred = static_cast<char>(fs::path::preferred_separator);
    std::replace(result.begin(), result.end(), preferred == '/' ? '\\' : '/', preferred);
    return result;
}

std::string normalize_path(const std::string& path) {
    if (path.empty()) return path;

    std::string host = to_host_separators(path);
    std::string normalized = fs::path(host).lexically_normal().string();

    // Preserve trailing separator if original had one
    if (path.back() == '/' || path.back() == '\\') {
        if (!normalized.empty() && normalized.back() != '/' && normalized.back() != '\\') {
            normalized += static_cast<char>(fs::path::preferred_separator);
        }
    }

    return normalized;
}

std::string path_stem(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    std::string file_name = slash == std::string::npos ? path : path.substr(slash + 1);
    size_t dot = file_name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return file_name;
    }
    return file_name.substr(0, dot);
}

std::string path_extension(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    std::string file_name = slash == std::string::npos ? path : path.substr(slash + 1);
    size_t dot = file_name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return "";
    }
    return to_lower(file_name.substr(dot));
}

bool has_invalid_path_chars(const std::string& path) {
    return std::any_of(path.begin(), path.end(), [](unsigned char c) {
        return c < 0x20 || c == '<' || c == '>' || c == '|' || c == '"';
    });
}

} // namespace slnmodel
