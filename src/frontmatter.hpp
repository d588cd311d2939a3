#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace agentsync {

// Flat metadata block: keys in insertion order, values are booleans or strings.
using FrontMatter = nlohmann::ordered_json;

struct ParsedDocument {
    FrontMatter meta = FrontMatter::object();
    std::string body;
};

// Splits a leading "---" ... "---" block from `text`.
// Missing or unterminated blocks yield empty metadata and the whole text as body.
ParsedDocument parse_frontmatter(const std::string& text);

// Inverse of parse_frontmatter; no trailing newline after the closing delimiter.
std::string build_frontmatter(const FrontMatter& meta);

} // namespace agentsync
