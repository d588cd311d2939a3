#pragma once
#include "file_writer.hpp"
#include <string>
#include <vector>

namespace agentsync {

struct LinkReport {
    std::vector<std::string> created;
    std::vector<std::string> removed;
    std::vector<std::string> preserved;
    int unchanged = 0;

    int mutations() const { return static_cast<int>(created.size() + removed.size()); }
};

// Makes `target_dir` hold exactly one symlink per canonical skill.
// Only links resolving into `canonical_dir` are pruned; real files and
// directories are never replaced. A second run without canonical changes
// performs no mutations.
LinkReport reconcile_skill_links(const fs::path& target_dir, const fs::path& canonical_dir,
                                 FileWriter& writer);

// Symlinks directly below `dir` that resolve into `canonical_dir`, sorted.
std::vector<fs::path> managed_skill_links(const fs::path& dir, const fs::path& canonical_dir);

} // namespace agentsync
