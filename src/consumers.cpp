#include "consumers.hpp"
#include "errors.hpp"
#include <set>

namespace agentsync {

ConsumerRegistry::ConsumerRegistry(std::vector<ConsumerTarget> targets)
    : targets_(std::move(targets)) {}

ConsumerRegistry ConsumerRegistry::make_default(const fs::path& home) {
    std::vector<ConsumerTarget> t;

    {
        ConsumerTarget c;
        c.id = "cursor";
        c.label = "Cursor";
        c.description = "rules as .mdc + skill symlinks";
        c.import_shape = ImportShape::frontmatter_dir;
        c.generate_shape = GenerateShape::frontmatter_dir;
        c.rules_dir = home / ".cursor" / "rules";
        c.rules_ext = ".mdc";
        c.skills_dir = home / ".cursor" / "skills";
        t.push_back(std::move(c));
    }
    {
        ConsumerTarget c;
        c.id = "codex";
        c.label = "Codex";
        c.description = "rules as model-instructions.md + skill symlinks";
        c.import_shape = ImportShape::source_sections;
        c.generate_shape = GenerateShape::headed_concat;
        c.rules_file = home / ".codex" / "model-instructions.md";
        c.skills_dir = home / ".codex" / "skills";
        t.push_back(std::move(c));
    }
    {
        ConsumerTarget c;
        c.id = "claude";
        c.label = "Claude Code";
        c.description = "rules as CLAUDE.md";
        c.import_shape = ImportShape::heading_sections;
        c.generate_shape = GenerateShape::plain_concat;
        c.rules_file = home / ".claude" / "CLAUDE.md";
        t.push_back(std::move(c));
    }
    {
        ConsumerTarget c;
        c.id = "gemini";
        c.label = "Gemini CLI";
        c.description = "rules as GEMINI.md + skill symlinks";
        c.import_shape = ImportShape::heading_sections;
        c.generate_shape = GenerateShape::plain_concat;
        c.rules_file = home / ".gemini" / "GEMINI.md";
        c.skills_dir = home / ".gemini" / "skills";
        t.push_back(std::move(c));
    }
    {
        ConsumerTarget c;
        c.id = "kiro";
        c.label = "Kiro";
        c.description = "rules as steering/conventions.md";
        c.import_shape = ImportShape::flat_dir;
        c.generate_shape = GenerateShape::plain_concat;
        c.rules_file = home / ".kiro" / "steering" / "conventions.md";
        c.import_dir = home / ".kiro" / "steering";
        c.import_ext = ".md";
        t.push_back(std::move(c));
    }
    {
        ConsumerTarget c;
        c.id = "antigravity";
        c.label = "Antigravity";
        c.description = "skill symlinks only";
        c.generate_shape = GenerateShape::skills_only;
        c.skills_dir = home / ".gemini" / "antigravity" / "skills";
        t.push_back(std::move(c));
    }
    {
        ConsumerTarget c;
        c.id = "agents-md";
        c.label = "AGENTS.md";
        c.description = "condensed rules for cross-tool standard";
        c.generate_shape = GenerateShape::numbered_summary;
        t.push_back(std::move(c));
    }

    return ConsumerRegistry(std::move(t));
}

const ConsumerTarget* ConsumerRegistry::find(const std::string& id) const {
    for (auto& c : targets_) {
        if (c.id == id) return &c;
    }
    return nullptr;
}

const ConsumerTarget& ConsumerRegistry::require(const std::string& id) const {
    auto* c = find(id);
    if (!c) {
        throw SyncError(SyncErrorKind::unknown_consumer,
                        "unknown agent '" + id + "'. Options: " + join(ids(), ", "));
    }
    return *c;
}

std::vector<std::string> ConsumerRegistry::ids() const {
    std::vector<std::string> out;
    for (auto& c : targets_) out.push_back(c.id);
    return out;
}

std::vector<std::string> ConsumerRegistry::rule_target_ids() const {
    std::vector<std::string> out;
    for (auto& c : targets_) {
        if (c.is_rule_target()) out.push_back(c.id);
    }
    return out;
}

std::vector<std::string> ConsumerRegistry::skill_target_ids() const {
    std::vector<std::string> out;
    for (auto& c : targets_) {
        if (c.is_skill_target()) out.push_back(c.id);
    }
    return out;
}

std::vector<std::string> ConsumerRegistry::importer_ids() const {
    std::vector<std::string> out;
    for (auto& c : targets_) {
        if (c.import_shape != ImportShape::none) out.push_back(c.id);
    }
    return out;
}

bool is_reserved_skill_name(const std::string& name) {
    static const std::set<std::string> reserved = {".system", "cursor-migration-map"};
    static const std::vector<std::string> prefixes = {"pattern-"};
    if (reserved.count(name)) return true;
    for (auto& p : prefixes) {
        if (starts_with(name, p)) return true;
    }
    return false;
}

} // namespace agentsync
