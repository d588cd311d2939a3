#pragma once
#include <string>

namespace agentsync {

// First line of every file this tool writes.
inline constexpr const char* GENERATED_HEADER =
    "# Generated from ~/.ai-agent/ -- do not edit directly";

inline constexpr const char* REGENERATE_HINT = "# Run: agentsync sync";

// True if `text` starts with GENERATED_HEADER, ignoring leading whitespace.
bool is_generated(const std::string& text);

// Header line, regenerate hint and "Last synced" stamp, newline-terminated.
std::string generated_header_block();
std::string generated_header_block(const std::string& timestamp);

} // namespace agentsync
