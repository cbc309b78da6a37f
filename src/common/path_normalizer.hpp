#pragma once

#include <string>

namespace slnmodel {

// Replace both '/' and '\\' with the host's preferred separator
std::string to_host_separators(const std::string& path);

// Host separators plus lexical cleanup of "." and ".." segments.
// A trailing separator on the input is kept.
std::string normalize_path(const std::string& path);

// File stem of a path written with either separator: "a\\b\\Lib.csproj" -> "Lib"
std::string path_stem(const std::string& path);

// Lowercased extension with the dot: "a\\Lib.CSPROJ" -> ".csproj"
std::string path_extension(const std::string& path);

// Control characters and <>|" are not allowed in declared project paths
bool has_invalid_path_chars(const std::string& path);

} // namespace slnmodel
