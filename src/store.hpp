#pragma once
#include "layout.hpp"
#include "manifest.hpp"
#include "file_writer.hpp"
#include <string>
#include <vector>

namespace agentsync {

// Read access to the canonical rules and skills directories.
class DocumentStore {
public:
    explicit DocumentStore(const Layout& layout) : layout_(layout) {}

    fs::path rules_dir() const { return layout_.rules_dir(); }
    fs::path skills_dir() const { return layout_.skills_dir(); }

    // Resolves a manifest `file` entry; rejects paths escaping the rules dir.
    fs::path rule_path(const std::string& file) const;
    fs::path rule_path(const RuleRecord& rule) const { return rule_path(rule.file); }

    std::string read_rule(const RuleRecord& rule) const;
    bool rule_file_exists(const std::string& file) const;

    // Immediate subdirectories of the canonical skills store, sorted.
    std::vector<std::string> skill_names() const;

private:
    Layout layout_;
};

// Loads and persists the manifest file.
class ManifestStore {
public:
    explicit ManifestStore(const Layout& layout) : layout_(layout) {}

    bool exists() const { return fs::exists(layout_.manifest_path()); }

    // Throws SyncError(not_initialized) when the manifest is missing.
    Manifest read() const;

    // Stamps `updated` with today's UTC date and writes through `writer`.
    void write(Manifest& m, FileWriter& writer) const;

    static std::string serialize(const Manifest& m);

private:
    Layout layout_;
};

} // namespace agentsync
