#pragma once
#include "consumers.hpp"
#include "layout.hpp"
#include "manifest.hpp"
#include "skill_links.hpp"
#include "store.hpp"
#include <string>
#include <vector>

namespace agentsync {

// Everything a generator needs for one command invocation.
struct GenerateContext {
    const Layout& layout;
    const DocumentStore& store;
    FileWriter& writer;
    std::string timestamp;   // "Last synced" stamp shared by all outputs of one run
};

// Default AGENTS.md header when the manifest carries none.
inline constexpr const char* DEFAULT_AGENTS_HEADER = "# AGENTS Rules";

inline constexpr size_t SUMMARY_MAX_LEN = 120;

struct GenerateResult {
    int files_written = 0;
    int files_removed = 0;
    std::vector<fs::path> outputs;
    std::optional<LinkReport> skills;
};

// Renders the manifest's rule set for `consumer`. With `link_skills`, a
// consumer that has a skills directory also gets its skill links reconciled.
GenerateResult generate(const ConsumerTarget& consumer, const Manifest& manifest,
                        GenerateContext& ctx, bool link_skills = true);

// Reconciles the consumer's skill links; no-op without a skills directory.
std::optional<LinkReport> sync_consumer_skills(const ConsumerTarget& consumer, GenerateContext& ctx);

// ── Rendering, exposed for tests ────────────────────────────────────

std::string render_frontmatter_rule(const RuleRecord& rule, const std::string& body,
                                    const std::string& header_block);

std::string render_headed_concat(const std::vector<std::pair<std::string, std::string>>& rules,
                                 const std::string& header_block);

std::string render_plain_concat(const std::vector<std::string>& bodies,
                                const std::string& header_block);

// Description, else first non-heading line of `body` (truncated), else the id.
std::string rule_summary(const RuleRecord& rule, const std::optional<std::string>& body);

std::string render_numbered_summary(const AgentsMdConfig& config,
                                    const std::vector<std::pair<std::string, std::string>>& id_summaries,
                                    const std::string& header_block);

// Configured AGENTS.md locations: '~' expanded, globs expanded, directories
// mapped to <dir>/AGENTS.md. Patterns without matches are warned about.
std::vector<fs::path> expand_output_paths(const std::vector<std::string>& patterns,
                                          const fs::path& home);

} // namespace agentsync
