#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "utils.hpp"

namespace agentsync {

struct CursorMeta {
    std::optional<bool> always_apply;
    std::optional<std::string> description;
    std::optional<std::string> globs;

    bool empty() const { return !always_apply && !description && !globs; }
};

struct RuleRecord {
    std::string id;
    std::string file;            // relative to the canonical rules directory
    std::string imported_from;   // consumer id, "manual" or "test"
    std::optional<CursorMeta> cursor;
    std::vector<std::string> exclude;

    bool excluded_for(const std::string& consumer) const;
};

struct SkillTarget {
    std::string name;
    std::string sync_mode = "symlink";
    std::string conflict_strategy = "preserve";
};

struct ActiveTargets {
    std::vector<std::string> rules;
    std::vector<SkillTarget> skills;

    std::vector<std::string> skill_names() const;
    void set_skill_names(const std::vector<std::string>& names);
};

struct AgentsMdConfig {
    std::vector<std::string> paths;
    std::string header = "# Workspace AGENTS Rules";
    std::string preamble = "These rules apply across this workspace unless explicitly overridden.";
};

struct Manifest {
    std::string version = "1.0";
    std::string updated;
    std::vector<std::string> imported_from;
    ActiveTargets active_targets;
    std::vector<RuleRecord> rules;
    std::string skills_shared_dir = "skills";
    AgentsMdConfig agents_md;

    const RuleRecord* find_rule(const std::string& id) const;
    bool has_rule(const std::string& id) const { return find_rule(id) != nullptr; }
    bool remove_rule(const std::string& id);

    // Rules not excluded for `consumer`, in manifest order.
    std::vector<RuleRecord> rules_for(const std::string& consumer) const;

    nlohmann::ordered_json to_json() const;
    static Manifest from_json(const nlohmann::json& j);
};

nlohmann::ordered_json cursor_meta_to_json(const CursorMeta& meta);
CursorMeta cursor_meta_from_json(const nlohmann::json& j);

// Dotted manifest keys that may be set from outside.
struct SettableKey {
    std::string key;
    bool is_array;
};

const std::vector<SettableKey>& settable_keys();

// Applies `value` to `key`; arrays take comma-separated input.
// Throws SyncError(unsupported_key) for keys outside the allow-list.
void apply_setting(Manifest& m, const std::string& key, const std::string& value);

// Current value of a settable key, rendered for display.
std::string setting_display(const Manifest& m, const std::string& key);

} // namespace agentsync
