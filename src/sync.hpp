#pragma once
#include "consumers.hpp"
#include "generators.hpp"
#include "store.hpp"
#include <string>
#include <vector>

namespace agentsync {

enum class SyncPhase { idle, rules, skills, persisted, done };

struct SyncReport {
    int rule_targets = 0;
    int skill_targets = 0;
    int files_written = 0;
    int files_removed = 0;
    int links_created = 0;
    int links_removed = 0;
    std::vector<std::string> failures;   // consumer ids whose generator threw
    bool persisted = false;

    bool ok() const { return failures.empty(); }
};

// Drives the generators for the manifest's active targets.
// Idle -> Rules -> Skills -> Persisted -> Done. A failing consumer is
// reported and skipped; the manifest is only rewritten when none failed.
class SyncEngine {
public:
    SyncEngine(const Layout& layout, const ConsumerRegistry& registry,
               const DocumentStore& docs, const ManifestStore& manifests,
               FileWriter& writer)
        : layout_(layout), registry_(registry), docs_(docs),
          manifests_(manifests), writer_(writer) {}

    // Throws SyncError(unknown_consumer) for an unregistered restriction
    // or active target. Touches nothing.
    void validate(const Manifest& m) const;

    SyncReport run(Manifest& m);

    SyncPhase phase() const { return phase_; }

private:
    const Layout& layout_;
    const ConsumerRegistry& registry_;
    const DocumentStore& docs_;
    const ManifestStore& manifests_;
    FileWriter& writer_;
    SyncPhase phase_ = SyncPhase::idle;

    void run_rules(const Manifest& m, GenerateContext& ctx, SyncReport& report,
                   std::vector<std::string>& linked);
    void run_skills(const Manifest& m, GenerateContext& ctx, SyncReport& report,
                    const std::vector<std::string>& linked);
};

} // namespace agentsync
