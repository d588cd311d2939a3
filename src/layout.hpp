#pragma once
#include "utils.hpp"

namespace agentsync {

// Fixed on-disk layout of the canonical store, rooted at <home>/.ai-agent.
struct Layout {
    fs::path home;
    fs::path root;

    fs::path manifest_path() const { return root / "manifest.json"; }
    fs::path rules_dir() const { return root / "rules"; }
    fs::path skills_dir() const { return root / "skills"; }
    fs::path backups_dir() const { return root / "backups"; }

    static Layout for_home(const fs::path& home_path) {
        Layout l;
        l.home = fs::absolute(home_path).lexically_normal();
        l.root = l.home / ".ai-agent";
        return l;
    }

    static Layout from_env() {
        return for_home(home_dir());
    }
};

} // namespace agentsync
