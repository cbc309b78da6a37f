#pragma once

namespace slnmodel {

// Per-call parser settings. Nothing here is read from the environment.
struct ParseOptions {
    char quote_char = '"';
    char comment_char = '#';

    // Rewrite declared paths to host separators (and collapse "." / "..")
    bool normalize_paths = false;

    // Accept legacy .vcproj entries, which otherwise need an upgrade first
    bool for_conversion = false;

    // Print warnings to stderr and progress to stdout as they happen.
    // Warnings are collected on the model either way.
    bool echo_warnings = true;
};

} // namespace slnmodel
