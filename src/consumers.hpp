#pragma once
#include "utils.hpp"
#include <string>
#include <vector>
#include <optional>

namespace agentsync {

// How existing rules are read back from a consumer.
enum class ImportShape {
    none,
    frontmatter_dir,     // one file per rule with a metadata block (.mdc)
    source_sections,     // single file split on "## Source: <name>"
    heading_sections,    // single file split on "# <heading>"
    flat_dir             // directory of plain files, one rule each
};

// How the canonical rule set is rendered for a consumer.
enum class GenerateShape {
    frontmatter_dir,     // <rules_dir>/<id><ext> with metadata block
    headed_concat,       // single file, "## Rule: <id>" per rule
    plain_concat,        // single file, bodies only
    numbered_summary,    // condensed list fanned out to configured paths
    skills_only
};

struct ConsumerTarget {
    std::string id;
    std::string label;
    std::string description;
    ImportShape import_shape = ImportShape::none;
    GenerateShape generate_shape = GenerateShape::skills_only;

    std::optional<fs::path> rules_dir;   // per-file consumers
    std::string rules_ext;               // e.g. ".mdc"
    std::optional<fs::path> rules_file;  // single-file consumers
    std::optional<fs::path> import_dir;  // flat_dir importers
    std::string import_ext;
    std::optional<fs::path> skills_dir;

    bool is_rule_target() const { return generate_shape != GenerateShape::skills_only; }
    bool is_skill_target() const { return skills_dir.has_value(); }

    // Where this consumer keeps its rules today (for source detection).
    std::optional<fs::path> rules_location() const {
        if (rules_dir) return rules_dir;
        if (rules_file) return rules_file;
        return std::nullopt;
    }
};

// Static table of supported consumers. Order is the canonical processing order.
class ConsumerRegistry {
public:
    explicit ConsumerRegistry(std::vector<ConsumerTarget> targets);

    static ConsumerRegistry make_default(const fs::path& home);

    const ConsumerTarget* find(const std::string& id) const;
    bool has(const std::string& id) const { return find(id) != nullptr; }

    const std::vector<ConsumerTarget>& all() const { return targets_; }
    std::vector<std::string> ids() const;
    std::vector<std::string> rule_target_ids() const;
    std::vector<std::string> skill_target_ids() const;
    std::vector<std::string> importer_ids() const;

    // Throws SyncError(unknown_consumer) when `id` is not registered.
    const ConsumerTarget& require(const std::string& id) const;

private:
    std::vector<ConsumerTarget> targets_;
};

// Skill directories never picked up during import.
bool is_reserved_skill_name(const std::string& name);

} // namespace agentsync
