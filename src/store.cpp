#include "store.hpp"
#include "errors.hpp"
#include <algorithm>

namespace agentsync {

// ── DocumentStore ───────────────────────────────────────────────────

fs::path DocumentStore::rule_path(const std::string& file) const {
    fs::path rel(file);
    auto full = (layout_.rules_dir() / rel).lexically_normal();
    if (rel.is_absolute() || !path_within(full, layout_.rules_dir())) {
        throw std::runtime_error("rule file '" + file + "' resolves outside " +
                                 layout_.rules_dir().string());
    }
    return full;
}

std::string DocumentStore::read_rule(const RuleRecord& rule) const {
    return read_file_or_throw(rule_path(rule));
}

bool DocumentStore::rule_file_exists(const std::string& file) const {
    return fs::exists(rule_path(file));
}

std::vector<std::string> DocumentStore::skill_names() const {
    std::vector<std::string> names;
    auto dir = layout_.skills_dir();
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return names;
    for (auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_directory()) names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

// ── ManifestStore ───────────────────────────────────────────────────

Manifest ManifestStore::read() const {
    auto path = layout_.manifest_path();
    if (!fs::exists(path)) {
        throw SyncError(SyncErrorKind::not_initialized,
                        path.string() + " not found. Run 'init' first.");
    }
    auto j = nlohmann::json::parse(read_file_or_throw(path));
    return Manifest::from_json(j);
}

std::string ManifestStore::serialize(const Manifest& m) {
    return m.to_json().dump(2) + "\n";
}

void ManifestStore::write(Manifest& m, FileWriter& writer) const {
    m.updated = utc_date_str();
    writer.write(layout_.manifest_path(), serialize(m));
}

} // namespace agentsync
