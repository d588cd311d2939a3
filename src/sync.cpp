#include "sync.hpp"
#include "errors.hpp"
#include <algorithm>

namespace agentsync {

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

// Active ids narrowed to the --only consumer, if any.
static std::vector<std::string> restrict_to(const std::vector<std::string>& active,
                                            const std::string& only) {
    if (only.empty()) return active;
    if (contains(active, only)) return {only};
    return {};
}

static void tally(const GenerateResult& g, SyncReport& report) {
    report.files_written += g.files_written;
    report.files_removed += g.files_removed;
    if (g.skills) {
        report.links_created += static_cast<int>(g.skills->created.size());
        report.links_removed += static_cast<int>(g.skills->removed.size());
    }
}

void SyncEngine::validate(const Manifest& m) const {
    const auto& opts = writer_.options();
    if (!opts.only.empty()) registry_.require(opts.only);
    for (auto& id : m.active_targets.rules) registry_.require(id);
    for (auto& id : m.active_targets.skill_names()) registry_.require(id);
}

SyncReport SyncEngine::run(Manifest& m) {
    validate(m);

    SyncReport report;
    GenerateContext ctx{layout_, docs_, writer_, utc_iso_str()};
    std::vector<std::string> linked;

    phase_ = SyncPhase::rules;
    run_rules(m, ctx, report, linked);

    phase_ = SyncPhase::skills;
    run_skills(m, ctx, report, linked);

    phase_ = SyncPhase::persisted;
    if (writer_.options().dry_run) {
        log_verbose(writer_.options(), "[dry-run] Would update manifest timestamp");
    } else if (!report.ok()) {
        log_error("sync", "manifest not updated, failed: " + join(report.failures, ", "));
    } else {
        manifests_.write(m, writer_);
        report.persisted = true;
    }

    phase_ = SyncPhase::done;
    section_header("Summary");
    std::cout << "  " << report.rule_targets << " rule targets, "
              << report.skill_targets << " skill targets synced."
              << (writer_.options().dry_run ? " (dry-run)" : "") << "\n";
    if (!report.ok()) {
        std::cout << "  " << report.failures.size() << " failed: " << join(report.failures, ", ") << "\n";
    }
    std::cout << "\n";
    return report;
}

void SyncEngine::run_rules(const Manifest& m, GenerateContext& ctx, SyncReport& report,
                           std::vector<std::string>& linked) {
    section_header("Rules");
    auto skill_ids = m.active_targets.skill_names();
    for (auto& id : restrict_to(m.active_targets.rules, writer_.options().only)) {
        const auto& consumer = registry_.require(id);
        if (!consumer.is_rule_target()) continue;

        summary_line(consumer.label, m.rules_for(id).size(), "rules");
        bool link = contains(skill_ids, id);
        try {
            tally(generate(consumer, m, ctx, link), report);
            if (link) linked.push_back(id);
        } catch (const std::exception& e) {
            log_error("sync", consumer.label + ": " + e.what());
            report.failures.push_back(id);
        }
        report.rule_targets++;
    }
}

void SyncEngine::run_skills(const Manifest& m, GenerateContext& ctx, SyncReport& report,
                            const std::vector<std::string>& linked) {
    section_header("Skills");
    size_t skill_count = docs_.skill_names().size();
    for (auto& id : restrict_to(m.active_targets.skill_names(), writer_.options().only)) {
        const auto& consumer = registry_.require(id);
        if (!consumer.is_skill_target()) continue;

        summary_line(consumer.label, skill_count, "symlinks");
        report.skill_targets++;
        // Rule generators already reconciled their consumer's links.
        if (contains(linked, id) || contains(report.failures, id)) continue;
        try {
            GenerateResult g;
            g.skills = sync_consumer_skills(consumer, ctx);
            tally(g, report);
        } catch (const std::exception& e) {
            log_error("sync", consumer.label + " skills: " + e.what());
            report.failures.push_back(id);
        }
    }
}

} // namespace agentsync
