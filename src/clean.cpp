#include "clean.hpp"
#include "frontmatter.hpp"
#include "generators.hpp"
#include "marker.hpp"
#include "skill_links.hpp"
#include <algorithm>

namespace agentsync {

bool CleanPlan::will_restore(const fs::path& p) const {
    return std::find(restorable.begin(), restorable.end(), p) != restorable.end();
}

// ── Discovery ───────────────────────────────────────────────────────

static bool file_is_generated(const fs::path& p) {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) return false;
    return is_generated(read_file(p));
}

std::vector<fs::path> find_generated_outputs(const Manifest& m, const ConsumerRegistry& registry,
                                             const Layout& layout) {
    std::vector<fs::path> found;
    for (auto& id : m.active_targets.rules) {
        const auto& consumer = registry.require(id);
        switch (consumer.generate_shape) {
            case GenerateShape::frontmatter_dir: {
                std::error_code ec;
                if (!fs::is_directory(*consumer.rules_dir, ec)) break;
                std::vector<fs::path> files;
                for (auto& entry : fs::directory_iterator(*consumer.rules_dir)) {
                    if (!entry.is_regular_file()) continue;
                    if (entry.path().extension().string() != consumer.rules_ext) continue;
                    if (is_generated(parse_frontmatter(read_file(entry.path())).body)) {
                        files.push_back(entry.path());
                    }
                }
                std::sort(files.begin(), files.end());
                found.insert(found.end(), files.begin(), files.end());
                break;
            }
            case GenerateShape::numbered_summary:
                for (auto& p : expand_output_paths(m.agents_md.paths, layout.home)) {
                    if (file_is_generated(p)) found.push_back(p);
                }
                break;
            case GenerateShape::headed_concat:
            case GenerateShape::plain_concat:
                if (consumer.rules_file && file_is_generated(*consumer.rules_file)) {
                    found.push_back(*consumer.rules_file);
                }
                break;
            case GenerateShape::skills_only:
                break;
        }
    }
    return found;
}

std::vector<fs::path> find_skill_links(const Manifest& m, const ConsumerRegistry& registry,
                                       const Layout& layout) {
    std::vector<fs::path> found;
    for (auto& id : m.active_targets.skill_names()) {
        const auto& consumer = registry.require(id);
        if (!consumer.skills_dir) continue;
        for (auto& link : managed_skill_links(*consumer.skills_dir, layout.skills_dir())) {
            found.push_back(link);
        }
    }
    return found;
}

CleanPlan plan_clean(const Manifest& m, const ConsumerRegistry& registry,
                     const Layout& layout, const BackupManager& backups) {
    CleanPlan plan;
    plan.generated = find_generated_outputs(m, registry, layout);
    plan.links = find_skill_links(m, registry, layout);
    plan.session = backups.latest_session();
    if (!plan.session) return plan;

    auto discovered = [&](const fs::path& p) {
        auto norm = p.lexically_normal();
        for (auto* list : {&plan.generated, &plan.links}) {
            for (auto& d : *list) {
                if (fs::absolute(d).lexically_normal() == norm) return true;
            }
        }
        return false;
    };

    for (auto& original : backups.mirrored_originals(*plan.session)) {
        if (!discovered(original)) continue;
        // A mirrored copy that is itself generated output is not an original.
        if (is_generated(read_file(backups.backup_dest(*plan.session, original)))) continue;
        plan.restorable.push_back(original);
    }
    return plan;
}

// ── Execution ───────────────────────────────────────────────────────

CleanResult execute_clean(const CleanPlan& plan, BackupManager& backups, const RunOptions& opts) {
    CleanResult result;
    for (auto& f : plan.generated) {
        if (opts.dry_run) {
            log_verbose(opts, "[dry-run] Would remove " + f.string());
        } else {
            std::error_code ec;
            fs::remove(f, ec);
            if (ec) {
                log_error("clean", "cannot remove " + f.string() + ": " + ec.message());
                continue;
            }
            log_verbose(opts, "Removed " + f.string());
        }
        result.removed_files++;
    }

    for (auto& link : plan.links) {
        if (opts.dry_run) {
            log_verbose(opts, "[dry-run] Would remove symlink " + link.string());
        } else {
            std::error_code ec;
            fs::remove(link, ec);
            if (ec) {
                log_error("clean", "cannot remove " + link.string() + ": " + ec.message());
                continue;
            }
            log_verbose(opts, "Removed symlink " + link.string());
        }
        result.removed_links++;
    }

    if (plan.session && !plan.restorable.empty()) {
        result.restored = backups.restore(*plan.session, plan.restorable);
    }
    return result;
}

} // namespace agentsync
