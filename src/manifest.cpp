#include "manifest.hpp"
#include "errors.hpp"
#include "options.hpp"
#include <algorithm>

namespace agentsync {

bool RuleRecord::excluded_for(const std::string& consumer) const {
    return std::find(exclude.begin(), exclude.end(), consumer) != exclude.end();
}

std::vector<std::string> ActiveTargets::skill_names() const {
    std::vector<std::string> out;
    for (auto& s : skills) out.push_back(s.name);
    return out;
}

void ActiveTargets::set_skill_names(const std::vector<std::string>& names) {
    std::vector<SkillTarget> next;
    for (auto& n : names) {
        auto it = std::find_if(skills.begin(), skills.end(),
                               [&](const SkillTarget& s) { return s.name == n; });
        if (it != skills.end()) {
            next.push_back(*it);
        } else {
            SkillTarget st;
            st.name = n;
            next.push_back(st);
        }
    }
    skills = std::move(next);
}

const RuleRecord* Manifest::find_rule(const std::string& id) const {
    for (auto& r : rules) {
        if (r.id == id) return &r;
    }
    return nullptr;
}

bool Manifest::remove_rule(const std::string& id) {
    auto before = rules.size();
    rules.erase(std::remove_if(rules.begin(), rules.end(),
                               [&](const RuleRecord& r) { return r.id == id; }),
                rules.end());
    return rules.size() != before;
}

std::vector<RuleRecord> Manifest::rules_for(const std::string& consumer) const {
    std::vector<RuleRecord> out;
    for (auto& r : rules) {
        if (!r.excluded_for(consumer)) out.push_back(r);
    }
    return out;
}

// ── JSON ────────────────────────────────────────────────────────────

nlohmann::ordered_json cursor_meta_to_json(const CursorMeta& meta) {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    if (meta.always_apply) j["alwaysApply"] = *meta.always_apply;
    if (meta.description) j["description"] = *meta.description;
    if (meta.globs) j["globs"] = *meta.globs;
    return j;
}

CursorMeta cursor_meta_from_json(const nlohmann::json& j) {
    CursorMeta meta;
    if (!j.is_object()) return meta;
    if (j.contains("alwaysApply") && j["alwaysApply"].is_boolean()) {
        meta.always_apply = j["alwaysApply"].get<bool>();
    }
    if (j.contains("description") && j["description"].is_string()) {
        meta.description = j["description"].get<std::string>();
    }
    if (j.contains("globs") && j["globs"].is_string()) {
        meta.globs = j["globs"].get<std::string>();
    }
    return meta;
}

nlohmann::ordered_json Manifest::to_json() const {
    nlohmann::ordered_json j;
    j["version"] = version;
    j["updated"] = updated;
    j["imported_from"] = imported_from;

    auto& at = j["active_targets"];
    at["rules"] = active_targets.rules;
    at["skills"] = nlohmann::ordered_json::array();
    for (auto& s : active_targets.skills) {
        at["skills"].push_back({
            {"name", s.name},
            {"sync_mode", s.sync_mode},
            {"conflict_strategy", s.conflict_strategy}
        });
    }

    j["rules"] = nlohmann::ordered_json::array();
    for (auto& r : rules) {
        nlohmann::ordered_json e;
        e["id"] = r.id;
        e["file"] = r.file;
        e["imported_from"] = r.imported_from;
        if (r.cursor && !r.cursor->empty()) e["cursor"] = cursor_meta_to_json(*r.cursor);
        if (!r.exclude.empty()) e["exclude"] = r.exclude;
        j["rules"].push_back(std::move(e));
    }

    j["skills"] = {{"shared_dir", skills_shared_dir}};
    j["agents_md"] = {
        {"paths", agents_md.paths},
        {"header", agents_md.header},
        {"preamble", agents_md.preamble}
    };
    return j;
}

static std::vector<std::string> parse_string_array(const nlohmann::json& arr) {
    std::vector<std::string> result;
    if (arr.is_array()) {
        for (auto& item : arr) {
            if (item.is_string()) result.push_back(item.get<std::string>());
        }
    }
    return result;
}

static SkillTarget parse_skill_target(const nlohmann::json& j) {
    SkillTarget st;
    if (j.is_string()) {
        st.name = j.get<std::string>();
        return st;
    }
    if (!j.is_object()) return st;

    st.name = j.value("name", "");
    st.sync_mode = j.value("sync_mode", st.sync_mode);
    st.conflict_strategy = j.value("conflict_strategy", st.conflict_strategy);
    if (st.sync_mode != "symlink") {
        log_warn("manifest", "skill target '" + st.name + "' has unsupported sync_mode '" +
                 st.sync_mode + "', using symlink");
        st.sync_mode = "symlink";
    }
    if (st.conflict_strategy != "preserve") {
        log_warn("manifest", "skill target '" + st.name + "' has unsupported conflict_strategy '" +
                 st.conflict_strategy + "', using preserve");
        st.conflict_strategy = "preserve";
    }
    return st;
}

Manifest Manifest::from_json(const nlohmann::json& j) {
    Manifest m;
    m.version = j.value("version", m.version);
    m.updated = j.value("updated", m.updated);
    if (j.contains("imported_from")) m.imported_from = parse_string_array(j["imported_from"]);

    if (j.contains("active_targets") && j["active_targets"].is_object()) {
        auto& at = j["active_targets"];
        if (at.contains("rules")) m.active_targets.rules = parse_string_array(at["rules"]);
        if (at.contains("skills") && at["skills"].is_array()) {
            for (auto& s : at["skills"]) {
                auto st = parse_skill_target(s);
                if (!st.name.empty()) m.active_targets.skills.push_back(std::move(st));
            }
        }
    }

    if (j.contains("rules") && j["rules"].is_array()) {
        for (auto& e : j["rules"]) {
            RuleRecord r;
            r.id = e.value("id", "");
            if (r.id.empty()) continue;
            r.file = e.value("file", r.id + ".md");
            r.imported_from = e.value("imported_from", "");
            if (e.contains("cursor") && e["cursor"].is_object()) {
                auto meta = cursor_meta_from_json(e["cursor"]);
                if (!meta.empty()) r.cursor = meta;
            }
            if (e.contains("exclude")) r.exclude = parse_string_array(e["exclude"]);
            m.rules.push_back(std::move(r));
        }
    }

    if (j.contains("skills") && j["skills"].is_object()) {
        m.skills_shared_dir = j["skills"].value("shared_dir", m.skills_shared_dir);
    }

    if (j.contains("agents_md") && j["agents_md"].is_object()) {
        auto& am = j["agents_md"];
        if (am.contains("paths")) m.agents_md.paths = parse_string_array(am["paths"]);
        m.agents_md.header = am.value("header", "");
        m.agents_md.preamble = am.value("preamble", "");
    }
    return m;
}

// ── Settable keys ───────────────────────────────────────────────────

const std::vector<SettableKey>& settable_keys() {
    static const std::vector<SettableKey> keys = {
        {"agents_md.header", false},
        {"agents_md.paths", true},
        {"agents_md.preamble", false},
    };
    return keys;
}

static std::string supported_keys_list() {
    std::vector<std::string> names;
    for (auto& k : settable_keys()) names.push_back(k.key);
    return join(names, ", ");
}

void apply_setting(Manifest& m, const std::string& key, const std::string& value) {
    if (key == "agents_md.paths") {
        m.agents_md.paths = split_csv(value);
    } else if (key == "agents_md.header") {
        m.agents_md.header = value;
    } else if (key == "agents_md.preamble") {
        m.agents_md.preamble = value;
    } else {
        throw SyncError(SyncErrorKind::unsupported_key,
                        "unsupported key '" + key + "'. Supported: " + supported_keys_list());
    }
}

std::string setting_display(const Manifest& m, const std::string& key) {
    if (key == "agents_md.paths") return "[" + join(m.agents_md.paths, ", ") + "]";
    if (key == "agents_md.header") return m.agents_md.header;
    if (key == "agents_md.preamble") return m.agents_md.preamble;
    return "";
}

} // namespace agentsync
