#include "skill_links.hpp"
#include <algorithm>
#include <set>

namespace agentsync {

static fs::path resolve(const fs::path& p) {
    std::error_code ec;
    auto r = fs::weakly_canonical(p, ec);
    return ec ? p.lexically_normal() : r;
}

// Where the link points, made absolute relative to the link's directory.
static fs::path link_destination(const fs::path& link) {
    std::error_code ec;
    auto target = fs::read_symlink(link, ec);
    if (ec) return {};
    if (target.is_relative()) target = link.parent_path() / target;
    return resolve(target);
}

static std::vector<std::string> canonical_names(const fs::path& canonical_dir) {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(canonical_dir, ec)) return names;
    for (auto& entry : fs::directory_iterator(canonical_dir)) {
        if (entry.is_directory()) names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<fs::path> managed_skill_links(const fs::path& dir, const fs::path& canonical_dir) {
    std::vector<fs::path> out;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return out;

    auto canonical = resolve(canonical_dir);
    for (auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_symlink()) continue;
        if (path_within(link_destination(entry.path()), canonical)) out.push_back(entry.path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

LinkReport reconcile_skill_links(const fs::path& target_dir, const fs::path& canonical_dir,
                                 FileWriter& writer) {
    LinkReport report;
    auto names = canonical_names(canonical_dir);
    std::set<std::string> wanted(names.begin(), names.end());
    auto canonical = resolve(canonical_dir);

    // Prune: dangling or retargeted links into the canonical store
    for (auto& link : managed_skill_links(target_dir, canonical_dir)) {
        auto name = link.filename().string();
        bool stale = !wanted.count(name) || link_destination(link) != resolve(canonical / name);
        if (!stale) continue;
        writer.remove(link);
        report.removed.push_back(name);
        log_verbose(writer.options(), "Removed stale skill link: " + name);
    }

    // Create
    if (!names.empty()) writer.create_directories(target_dir);
    for (auto& name : names) {
        auto link = target_dir / name;
        auto status = fs::symlink_status(link);
        bool removed = std::find(report.removed.begin(), report.removed.end(), name) != report.removed.end();

        if (fs::exists(status) && !removed) {
            if (fs::is_symlink(status) && link_destination(link) == resolve(canonical / name)) {
                report.unchanged++;
                continue;
            }
            if (!fs::is_symlink(status)) {
                log_verbose(writer.options(), "Skill '" + name + "' exists as real directory, preserving");
                report.preserved.push_back(name);
                continue;
            }
            // A foreign symlink of the same name is left alone.
            log_verbose(writer.options(), "Skill '" + name + "' links elsewhere, preserving");
            report.preserved.push_back(name);
            continue;
        }

        writer.create_symlink(link, canonical / name);
        report.created.push_back(name);
    }
    return report;
}

} // namespace agentsync
