#include "file_writer.hpp"
#include "text_diff.hpp"
#include <iostream>

namespace agentsync {

bool FileWriter::write(const fs::path& path, const std::string& content) {
    if (opts_.dry_run) {
        log_verbose(opts_, "[dry-run] Would write " + path.string() +
                    " (" + std::to_string(content.size()) + " bytes)");
        return true;
    }

    if (!path.parent_path().empty()) fs::create_directories(path.parent_path());
    bool exists = fs::exists(path);

    if (opts_.show_diff && exists) {
        std::string diff = unified_diff(read_file_or_throw(path), content,
                                        path.string(), path.string() + " (new)");
        if (diff.empty()) {
            log_verbose(opts_, path.string() + " (unchanged)");
            return false;
        }
        std::cout << diff << "\n";
    }

    if (exists) backups_.backup_file(path);
    write_file_or_throw(path, content);
    writes_++;
    log_verbose(opts_, "Wrote " + path.string());
    return true;
}

bool FileWriter::remove(const fs::path& path) {
    if (opts_.dry_run) {
        log_verbose(opts_, "[dry-run] Would remove " + path.string());
        return true;
    }

    auto status = fs::symlink_status(path);
    if (!fs::exists(status)) return false;
    if (!fs::is_symlink(status)) backups_.backup_file(path);
    fs::remove(path);
    log_verbose(opts_, "Removed " + path.string());
    return true;
}

bool FileWriter::create_symlink(const fs::path& link, const fs::path& target) {
    if (opts_.dry_run) {
        log("[dry-run] Would symlink " + link.string() + " -> " + target.string());
        return true;
    }
    if (!link.parent_path().empty()) fs::create_directories(link.parent_path());
    if (fs::is_directory(target)) {
        fs::create_directory_symlink(target, link);
    } else {
        fs::create_symlink(target, link);
    }
    log_verbose(opts_, "Symlinked " + link.filename().string());
    return true;
}

bool FileWriter::create_directories(const fs::path& dir) {
    if (fs::is_directory(dir)) return false;
    if (opts_.dry_run) {
        log_verbose(opts_, "[dry-run] Would create " + dir.string());
        return true;
    }
    return fs::create_directories(dir);
}

bool FileWriter::remove_directory(const fs::path& dir) {
    if (!fs::is_directory(fs::symlink_status(dir))) return false;
    if (opts_.dry_run) {
        log_verbose(opts_, "[dry-run] Would remove dir " + dir.string());
        return true;
    }
    backups_.backup_directory(dir);
    fs::remove_all(dir);
    log_verbose(opts_, "Removed dir " + dir.string());
    return true;
}

bool FileWriter::copy_directory(const fs::path& src, const fs::path& dest) {
    if (fs::exists(fs::symlink_status(dest))) return false;
    if (opts_.dry_run) {
        log("[dry-run] Would copy " + src.string() + " -> " + dest.string());
        return true;
    }
    if (!dest.parent_path().empty()) fs::create_directories(dest.parent_path());
    fs::copy(src, dest, fs::copy_options::recursive);
    log_verbose(opts_, "Copied " + src.string() + " -> " + dest.string());
    return true;
}

} // namespace agentsync
