#pragma once
#include "backup.hpp"
#include "clean.hpp"
#include "consumers.hpp"
#include "file_writer.hpp"
#include "prompt.hpp"
#include "store.hpp"
#include "sync.hpp"
#include <string>

namespace agentsync {

struct AddRuleRequest {
    std::string id;
    std::string description;
    bool always_apply = true;
    std::string from_file;   // body source; empty = derived template
    std::string exclude;     // comma-separated consumer ids
};

// One command invocation: owns its backup session and write primitive.
// Methods throw SyncError for fatal conditions, always before mutating.
class Engine {
public:
    Engine(const Layout& layout, const RunOptions& opts, DecisionProvider& decisions);
    Engine(const Layout& layout, ConsumerRegistry registry, const RunOptions& opts,
           DecisionProvider& decisions);
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Returns false when the trailing sync reported failures. Aborting is not a failure.
    bool init();
    SyncReport sync();
    SyncReport sync(Manifest& m);
    void status(std::ostream& out);
    SyncReport reconfigure();
    SyncReport add_rule(const AddRuleRequest& req);
    SyncReport remove_rule(const std::string& id);
    void set(const std::string& key, const std::string& value);
    // Returns std::nullopt when there was nothing to clean or the user declined.
    std::optional<CleanResult> clean();

private:
    Layout layout_;
    ConsumerRegistry registry_;
    RunOptions opts_;
    DecisionProvider& decisions_;
    BackupManager backups_;
    FileWriter writer_;
    DocumentStore docs_;
    ManifestStore manifests_;

    SelectOptions target_options(const std::vector<std::string>& ids) const;
};

// ── CLI entry points ────────────────────────────────────────────────
// Each prints "Error: <message>" to stderr and returns 1 on failure.

int cmd_init(Engine& engine);
int cmd_sync(Engine& engine);
int cmd_status(Engine& engine);
int cmd_reconfigure(Engine& engine);
int cmd_add_rule(Engine& engine, const AddRuleRequest& req);
int cmd_remove_rule(Engine& engine, const std::string& id);
int cmd_set(Engine& engine, const std::string& key, const std::string& value);
int cmd_clean(Engine& engine);

} // namespace agentsync
