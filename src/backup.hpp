#pragma once
#include "layout.hpp"
#include "options.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace agentsync {

// One timestamped snapshot directory: backups/<name>/{meta.json,files/...}
struct BackupSession {
    std::string name;       // sortable UTC timestamp, optionally "-N" suffixed
    std::string created;
    std::string command;
    fs::path dir;

    fs::path files_root() const { return dir / "files"; }
};

// Owns the active backup session for one command invocation.
// A session is opened lazily; every path is copied at most once per session,
// so the session holds the state from just before the command ran.
class BackupManager {
public:
    BackupManager(const Layout& layout, const RunOptions& opts);

    // Opens the session for `command` now; no-op if one is already active.
    const BackupSession& init_session(const std::string& command);

    // Names the command whose session is opened on the first backup.
    void begin_command(const std::string& command) { pending_command_ = command; }

    const BackupSession* active() const { return active_ ? &*active_ : nullptr; }

    // Copies a regular file into the active session. Symlinks and missing
    // paths are skipped; dry-run only logs.
    void backup_file(const fs::path& path);

    // Copies a directory tree (symlinks followed) into the active session.
    void backup_directory(const fs::path& path);

    // Where `original` is mirrored inside `session`.
    fs::path backup_dest(const BackupSession& session, const fs::path& original) const;

    // Inverse of backup_dest for a file below session.files_root().
    fs::path original_path(const BackupSession& session, const fs::path& mirrored) const;

    // Newest valid session (one holding meta.json), by directory name.
    std::optional<BackupSession> latest_session() const;

    // Original paths that have a mirrored copy in `session`, sorted.
    std::vector<fs::path> mirrored_originals(const BackupSession& session) const;

    // Copies mirrored files back for every original listed in `targets`.
    // Returns the number of files restored (or that would be, under dry-run).
    int restore(const BackupSession& session, const std::vector<fs::path>& targets);

private:
    Layout layout_;
    const RunOptions& opts_;
    std::string pending_command_ = "unknown";
    std::optional<BackupSession> active_;
    std::set<std::string> backed_up_;

    const BackupSession& ensure_session();
    bool already_backed_up(const fs::path& path);
};

} // namespace agentsync
