#pragma once
#include "consumers.hpp"
#include "manifest.hpp"
#include "file_writer.hpp"
#include <optional>
#include <string>
#include <vector>

namespace agentsync {

// A rule read from a consumer, before deduplication.
struct ImportedRule {
    std::string id;
    std::string content;
    std::string source;
    std::optional<CursorMeta> cursor_meta;
};

struct ImportResult {
    std::vector<ImportedRule> rules;
    std::vector<fs::path> skill_dirs;
};

// Scans one consumer's existing rules and skills. Missing sources are
// logged and yield an empty result. Engine-generated content is skipped.
ImportResult import_consumer(const ConsumerTarget& consumer);

// Individual source shapes, exposed for tests.
std::vector<ImportedRule> import_frontmatter_dir(const ConsumerTarget& consumer);
std::vector<ImportedRule> import_source_sections(const ConsumerTarget& consumer);
std::vector<ImportedRule> import_heading_sections(const ConsumerTarget& consumer);
std::vector<ImportedRule> import_flat_dir(const ConsumerTarget& consumer);

// Unmanaged skill directories under `skills_dir`: no symlinks, no reserved names.
std::vector<fs::path> scan_skill_dirs(const fs::path& skills_dir);

// Copies skill directories into `canonical_dir`, keeping existing ones.
int import_skills(const std::vector<fs::path>& skill_dirs, const fs::path& canonical_dir,
                  FileWriter& writer);

// First non-heading, non-empty line, truncated; "(empty)" if none.
std::string rule_preview(const std::string& content, size_t max_len = 80);

} // namespace agentsync
