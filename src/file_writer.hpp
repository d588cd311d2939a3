#pragma once
#include "backup.hpp"
#include "options.hpp"
#include <string>

namespace agentsync {

// Single entry point for every filesystem mutation made by the engine.
// Honors dry-run and diff preview, and backs up what it overwrites or removes.
class FileWriter {
public:
    FileWriter(const RunOptions& opts, BackupManager& backups)
        : opts_(opts), backups_(backups) {}

    // Returns true if the file was (or, under dry-run, would be) written.
    bool write(const fs::path& path, const std::string& content);

    // Removes a file or symlink. Regular files are backed up first.
    bool remove(const fs::path& path);

    bool create_symlink(const fs::path& link, const fs::path& target);

    bool create_directories(const fs::path& dir);

    // Backs up a directory tree, then deletes it.
    bool remove_directory(const fs::path& dir);

    // Copies a directory tree; `dest` must not exist yet.
    bool copy_directory(const fs::path& src, const fs::path& dest);

    const RunOptions& options() const { return opts_; }

    int writes() const { return writes_; }

private:
    const RunOptions& opts_;
    BackupManager& backups_;
    int writes_ = 0;
};

} // namespace agentsync
