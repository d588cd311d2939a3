#pragma once
#include "backup.hpp"
#include "consumers.hpp"
#include "manifest.hpp"
#include <optional>
#include <vector>

namespace agentsync {

// What a clean would remove and restore. Built without touching anything.
struct CleanPlan {
    std::vector<fs::path> generated;    // sentinel-marked consumer files
    std::vector<fs::path> links;        // skill links into the canonical store
    std::vector<fs::path> restorable;   // subset of `generated`/`links` with a backed-up original
    std::optional<BackupSession> session;

    bool empty() const { return generated.empty() && links.empty(); }
    bool will_restore(const fs::path& p) const;
};

struct CleanResult {
    int removed_files = 0;
    int removed_links = 0;
    int restored = 0;
};

// Generated files of the manifest's active rule targets, sorted per consumer.
std::vector<fs::path> find_generated_outputs(const Manifest& m, const ConsumerRegistry& registry,
                                             const Layout& layout);

// Managed skill links of the manifest's active skill targets.
std::vector<fs::path> find_skill_links(const Manifest& m, const ConsumerRegistry& registry,
                                       const Layout& layout);

// Throws SyncError(unknown_consumer) for unregistered active targets.
CleanPlan plan_clean(const Manifest& m, const ConsumerRegistry& registry,
                     const Layout& layout, const BackupManager& backups);

// Deletes the discovered outputs and restores their originals.
// The canonical store is never touched. Dry-run only logs.
CleanResult execute_clean(const CleanPlan& plan, BackupManager& backups, const RunOptions& opts);

} // namespace agentsync
