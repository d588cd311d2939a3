#include "backup.hpp"
#include <algorithm>
#include <cstdio>
#include <nlohmann/json.hpp>

namespace agentsync {

// Mirror prefix for originals that live outside the home directory.
static const char* ABS_MIRROR = "__abs__";

BackupManager::BackupManager(const Layout& layout, const RunOptions& opts)
    : layout_(layout), opts_(opts) {}

// ── Session lifecycle ───────────────────────────────────────────────

const BackupSession& BackupManager::init_session(const std::string& command) {
    if (active_) return *active_;

    BackupSession s;
    s.created = utc_compact_str();
    s.command = command;
    s.name = s.created;
    s.dir = layout_.backups_dir() / s.name;

    // Two sessions in the same second: keep names unique and ordered.
    for (int n = 1; fs::exists(s.dir); n++) {
        char suffix[8];
        std::snprintf(suffix, sizeof(suffix), "-%03d", n);
        s.name = s.created + suffix;
        s.dir = layout_.backups_dir() / s.name;
    }

    if (opts_.dry_run) {
        log_verbose(opts_, "[dry-run] Would open backup session " + s.name + " (" + command + ")");
    } else {
        fs::create_directories(s.dir);
        nlohmann::ordered_json meta;
        meta["created"] = s.created;
        meta["command"] = command;
        write_file_or_throw(s.dir / "meta.json", meta.dump(2) + "\n");
        log_verbose(opts_, "Backup session " + s.name + " (" + command + ")");
    }

    active_ = std::move(s);
    return *active_;
}

const BackupSession& BackupManager::ensure_session() {
    return init_session(pending_command_);
}

bool BackupManager::already_backed_up(const fs::path& path) {
    auto key = path.lexically_normal().string();
    return !backed_up_.insert(key).second;
}

// ── Path mirroring ──────────────────────────────────────────────────

fs::path BackupManager::backup_dest(const BackupSession& session, const fs::path& original) const {
    auto abs = fs::absolute(original).lexically_normal();
    if (path_within(abs, layout_.home)) {
        return session.files_root() / abs.lexically_relative(layout_.home);
    }
    return session.files_root() / ABS_MIRROR / abs.relative_path();
}

fs::path BackupManager::original_path(const BackupSession& session, const fs::path& mirrored) const {
    auto rel = mirrored.lexically_relative(session.files_root());
    auto it = rel.begin();
    if (it != rel.end() && it->string() == ABS_MIRROR) {
        fs::path out("/");
        for (++it; it != rel.end(); ++it) out /= *it;
        return out;
    }
    return (layout_.home / rel).lexically_normal();
}

// ── Backup ──────────────────────────────────────────────────────────

void BackupManager::backup_file(const fs::path& path) {
    if (fs::is_symlink(fs::symlink_status(path))) return;
    if (!fs::exists(path) || !fs::is_regular_file(path)) return;
    if (already_backed_up(path)) return;

    if (opts_.dry_run) {
        log_verbose(opts_, "[dry-run] Would backup " + path.string());
        return;
    }
    auto& session = ensure_session();
    auto dest = backup_dest(session, path);
    fs::create_directories(dest.parent_path());
    fs::copy_file(path, dest, fs::copy_options::overwrite_existing);
    log_verbose(opts_, "Backed up " + path.string());
}

void BackupManager::backup_directory(const fs::path& path) {
    if (fs::is_symlink(fs::symlink_status(path))) return;
    if (!fs::is_directory(path)) return;
    if (already_backed_up(path)) return;

    if (opts_.dry_run) {
        log_verbose(opts_, "[dry-run] Would backup dir " + path.string());
        return;
    }
    auto& session = ensure_session();
    auto dest = backup_dest(session, path);
    if (fs::exists(dest)) fs::remove_all(dest);
    fs::create_directories(dest.parent_path());
    fs::copy(path, dest, fs::copy_options::recursive);
    log_verbose(opts_, "Backed up dir " + path.string());
}

// ── Lookup and restore ──────────────────────────────────────────────

std::optional<BackupSession> BackupManager::latest_session() const {
    auto root = layout_.backups_dir();
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return std::nullopt;

    std::vector<fs::path> candidates;
    for (auto& entry : fs::directory_iterator(root)) {
        if (!entry.is_directory()) continue;
        if (!fs::exists(entry.path() / "meta.json")) continue;
        candidates.push_back(entry.path());
    }
    if (candidates.empty()) return std::nullopt;

    auto newest = *std::max_element(candidates.begin(), candidates.end(),
        [](const fs::path& a, const fs::path& b) {
            return a.filename().string() < b.filename().string();
        });

    BackupSession s;
    s.dir = newest;
    s.name = newest.filename().string();
    s.created = s.name;
    try {
        auto meta = nlohmann::json::parse(read_file(newest / "meta.json"));
        s.created = meta.value("created", s.name);
        s.command = meta.value("command", "");
    } catch (const nlohmann::json::exception& e) {
        log_warn("backup", "unreadable meta.json in " + s.name + ": " + e.what());
    }
    return s;
}

std::vector<fs::path> BackupManager::mirrored_originals(const BackupSession& session) const {
    std::vector<fs::path> out;
    auto root = session.files_root();
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return out;

    for (auto& entry : fs::recursive_directory_iterator(root)) {
        if (!entry.is_regular_file()) continue;
        out.push_back(original_path(session, entry.path()));
    }
    std::sort(out.begin(), out.end());
    return out;
}

int BackupManager::restore(const BackupSession& session, const std::vector<fs::path>& targets) {
    auto root = session.files_root();
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return 0;

    std::set<std::string> wanted;
    for (auto& t : targets) wanted.insert(fs::absolute(t).lexically_normal().string());

    std::vector<fs::path> mirrored;
    for (auto& entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_regular_file()) mirrored.push_back(entry.path());
    }
    std::sort(mirrored.begin(), mirrored.end());

    int count = 0;
    for (auto& backed_up : mirrored) {
        auto original = original_path(session, backed_up);
        if (!wanted.count(original.string())) continue;

        if (opts_.dry_run) {
            log_verbose(opts_, "[dry-run] Would restore " + original.string());
            count++;
            continue;
        }
        fs::create_directories(original.parent_path());
        if (fs::is_symlink(fs::symlink_status(original))) fs::remove(original);
        fs::copy_file(backed_up, original, fs::copy_options::overwrite_existing);
        log_verbose(opts_, "Restored " + original.string());
        count++;
    }
    return count;
}

} // namespace agentsync
