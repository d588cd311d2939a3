#include "commands.hpp"
#include "dedup.hpp"
#include "errors.hpp"
#include "importers.hpp"
#include <algorithm>
#include <iomanip>
#include <set>

namespace agentsync {

static const char* RULE_TEMPLATE_BODY = "Add rule content here.";

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

static std::string pad(const std::string& s, size_t width) {
    return s.size() >= width ? s : s + std::string(width - s.size(), ' ');
}

Engine::Engine(const Layout& layout, const RunOptions& opts, DecisionProvider& decisions)
    : Engine(layout, ConsumerRegistry::make_default(layout.home), opts, decisions) {}

Engine::Engine(const Layout& layout, ConsumerRegistry registry, const RunOptions& opts,
               DecisionProvider& decisions)
    : layout_(layout),
      registry_(std::move(registry)),
      opts_(opts),
      decisions_(decisions),
      backups_(layout_, opts_),
      writer_(opts_, backups_),
      docs_(layout_),
      manifests_(layout_) {}

SelectOptions Engine::target_options(const std::vector<std::string>& ids) const {
    SelectOptions out;
    for (auto& id : ids) {
        const auto& c = registry_.require(id);
        out.emplace_back(id, c.label + "  (" + c.description + ")");
    }
    return out;
}

// ── init ────────────────────────────────────────────────────────────

bool Engine::init() {
    std::cout << "\n=== agentsync: first-time setup ===\n\n";

    std::vector<fs::path> existing;
    for (auto& p : {layout_.manifest_path(), layout_.rules_dir(), layout_.skills_dir()}) {
        if (fs::exists(p)) existing.push_back(p);
    }
    if (!existing.empty()) {
        std::cout << "  Warning: init will overwrite existing canonical content in "
                  << layout_.root.string() << ":\n";
        for (auto& p : existing) std::cout << "    - " << p.string() << "\n";
        std::cout << "\n  Source agent files are only read, never modified.\n\n";
        if (!opts_.auto_confirm && !decisions_.confirm("  Proceed?", true)) {
            std::cout << "  Aborted.\n";
            return true;
        }
    }

    // Step 1: sources
    SelectOptions source_options;
    std::vector<std::string> detected;
    for (auto& id : registry_.importer_ids()) {
        const auto& c = registry_.require(id);
        auto location = c.rules_location();
        if (location && fs::exists(*location)) detected.push_back(id);
        source_options.emplace_back(id, c.label + "  (" + (location ? location->string() : "n/a") + ")");
    }
    auto sources = decisions_.multi_select(
        "Step 1: Which agents do you currently have rules configured in?",
        source_options, detected);
    if (sources.empty()) {
        std::cout << "  No sources selected. Aborted.\n";
        return true;
    }

    // Step 2: scan and import, in registry order
    std::cout << "\nStep 2: Scanning selected sources...\n\n";
    std::vector<ImportedRule> all_rules;
    std::vector<fs::path> all_skills;
    for (auto& id : registry_.importer_ids()) {
        if (!contains(sources, id)) continue;
        auto imported = import_consumer(registry_.require(id));
        all_rules.insert(all_rules.end(), imported.rules.begin(), imported.rules.end());
        all_skills.insert(all_skills.end(), imported.skill_dirs.begin(), imported.skill_dirs.end());
    }
    std::cout << "\n  Deduplicating...\n";
    all_rules = deduplicate_rules(all_rules, decisions_, opts_);

    SelectOptions rule_options;
    std::vector<std::string> all_ids;
    for (auto& r : all_rules) {
        rule_options.emplace_back(r.id, pad(r.id, 30) + " [" + pad(r.source, 6) + "]  " + rule_preview(r.content));
        all_ids.push_back(r.id);
    }
    auto chosen_ids = decisions_.multi_select(
        "Step 2b: Select rules to import (" + std::to_string(all_rules.size()) + " found):",
        rule_options, all_ids);
    if (chosen_ids.empty()) {
        std::cout << "  No rules selected. Aborted.\n";
        return true;
    }
    all_rules.erase(std::remove_if(all_rules.begin(), all_rules.end(),
                                   [&](const ImportedRule& r) { return !contains(chosen_ids, r.id); }),
                    all_rules.end());

    if (!all_skills.empty()) {
        SelectOptions skill_options;
        std::vector<std::string> names;
        for (auto& s : all_skills) {
            auto name = s.filename().string();
            skill_options.emplace_back(name, pad(name, 30) + " [" + s.parent_path().string() + "]");
            names.push_back(name);
        }
        auto chosen = decisions_.multi_select(
            "Step 2c: Select skills to import (" + std::to_string(all_skills.size()) + " found):",
            skill_options, names);
        all_skills.erase(std::remove_if(all_skills.begin(), all_skills.end(),
                                        [&](const fs::path& s) { return !contains(chosen, s.filename().string()); }),
                         all_skills.end());
    }
    std::cout << "\n  Selected: " << all_rules.size() << " rules, " << all_skills.size() << " skills\n";

    // Step 3: targets
    auto rule_targets = decisions_.multi_select("Step 3a: Which agents do you want to sync RULES to?",
                                                target_options(registry_.rule_target_ids()),
                                                registry_.rule_target_ids());
    auto skill_targets = decisions_.multi_select("Step 3b: Which agents do you want to sync SKILLS to?",
                                                 target_options(registry_.skill_target_ids()),
                                                 registry_.skill_target_ids());

    // Step 4: AGENTS.md locations
    std::vector<std::string> agents_md_paths;
    if (contains(rule_targets, "agents-md")) {
        agents_md_paths = split_csv(decisions_.ask(
            "\n  AGENTS.md output paths (comma-separated, e.g. ~/Code/AGENTS.md):", ""));
    }

    section_header("Writing canonical source");
    backups_.init_session("init");

    writer_.remove_directory(layout_.rules_dir());
    writer_.create_directories(layout_.rules_dir());

    Manifest m;
    m.imported_from = sources;
    m.active_targets.rules = rule_targets;
    m.active_targets.set_skill_names(skill_targets);
    m.agents_md.paths = agents_md_paths;

    for (auto& rule : all_rules) {
        RuleRecord record;
        record.id = rule.id;
        record.file = rule.id + ".md";
        record.imported_from = rule.source;
        record.cursor = rule.cursor_meta;
        writer_.write(docs_.rule_path(record), rule.content + "\n");
        log("Created rules/" + record.file);
        m.rules.push_back(std::move(record));
    }

    int skill_count = import_skills(all_skills, layout_.skills_dir(), writer_);
    log(std::to_string(skill_count) + " skills imported");

    manifests_.write(m, writer_);
    log("Wrote " + layout_.manifest_path().string());

    if (opts_.dry_run) {
        log("[dry-run] Would sync " + std::to_string(rule_targets.size()) + " rule targets, " +
            std::to_string(skill_targets.size()) + " skill targets");
        return true;
    }
    auto report = sync(m);
    std::cout << "Done! Edit rules in " << layout_.rules_dir().string()
              << " and run 'agentsync sync' to propagate.\n";
    return report.ok();
}

// ── sync ────────────────────────────────────────────────────────────

SyncReport Engine::sync() {
    backups_.begin_command("sync");
    Manifest m = manifests_.read();
    return sync(m);
}

SyncReport Engine::sync(Manifest& m) {
    SyncEngine engine(layout_, registry_, docs_, manifests_, writer_);
    return engine.run(m);
}

// ── status ──────────────────────────────────────────────────────────

void Engine::status(std::ostream& out) {
    Manifest m = manifests_.read();

    out << "\n─── Rules (" << m.rules.size() << ") ───\n";
    if (m.rules.empty()) out << "  (none)\n";
    for (auto& r : m.rules) {
        std::vector<std::string> flags;
        std::string desc;
        if (r.cursor) {
            if (r.cursor->always_apply.value_or(false)) flags.push_back("alwaysApply");
            if (r.cursor->globs && !r.cursor->globs->empty()) flags.push_back("globs=" + *r.cursor->globs);
            desc = r.cursor->description.value_or("");
        }
        out << "  " << pad(r.id, 30) << " [" << pad(r.imported_from, 6) << "]  "
            << pad(join(flags, ", "), 20) << " " << desc << "\n";
    }

    out << "\n─── Active Targets ───\n";
    out << "  Rules  -> " << join(m.active_targets.rules, ", ") << "\n";
    out << "  Skills -> " << join(m.active_targets.skill_names(), ", ") << "\n";

    auto skills = docs_.skill_names();
    out << "\n─── Skills (" << skills.size() << ") ───\n";
    if (skills.empty()) out << "  (none)\n";
    for (size_t i = 0; i < skills.size(); i += 4) {
        out << " ";
        for (size_t j = i; j < std::min(i + 4, skills.size()); j++) out << " " << pad(skills[j], 20);
        out << "\n";
    }

    out << "\n─── AGENTS.md Paths ───\n";
    if (m.agents_md.paths.empty()) out << "  (none configured)\n";
    for (auto& p : m.agents_md.paths) out << "  " << p << "\n";

    out << "\n─── Last Synced ───\n";
    out << "  " << (m.updated.empty() ? "never" : m.updated) << "\n\n";
}

// ── reconfigure ─────────────────────────────────────────────────────

SyncReport Engine::reconfigure() {
    backups_.begin_command("reconfigure");
    Manifest m = manifests_.read();

    std::cout << "\n=== Reconfigure Sync Targets ===\n\n";
    std::cout << "  Current rule targets:  " << join(m.active_targets.rules, ", ") << "\n";
    std::cout << "  Current skill targets: " << join(m.active_targets.skill_names(), ", ") << "\n";

    m.active_targets.rules = decisions_.multi_select(
        "Select rule targets:", target_options(registry_.rule_target_ids()), m.active_targets.rules);
    m.active_targets.set_skill_names(decisions_.multi_select(
        "Select skill targets:", target_options(registry_.skill_target_ids()),
        m.active_targets.skill_names()));

    SyncEngine(layout_, registry_, docs_, manifests_, writer_).validate(m);
    manifests_.write(m, writer_);
    std::cout << "\n";
    return sync(m);
}

// ── add-rule / remove-rule ──────────────────────────────────────────

SyncReport Engine::add_rule(const AddRuleRequest& req) {
    backups_.begin_command("add-rule");
    Manifest m = manifests_.read();

    RuleRecord record;
    record.id = req.id;
    record.file = req.id + ".md";
    record.imported_from = "manual";
    if (req.id.empty() || req.id.find_first_of("/\\") != std::string::npos) {
        throw std::runtime_error("invalid rule id '" + req.id + "'");
    }
    auto path = docs_.rule_path(record);
    if (m.has_rule(req.id) || fs::exists(path)) {
        throw SyncError(SyncErrorKind::duplicate_rule_id, "rule '" + req.id + "' already exists");
    }
    record.exclude = split_csv(req.exclude);
    for (auto& id : record.exclude) registry_.require(id);
    SyncEngine(layout_, registry_, docs_, manifests_, writer_).validate(m);

    std::string content;
    if (!req.from_file.empty()) {
        content = read_file_or_throw(expand_path(req.from_file, layout_.home.string()));
    } else {
        content = "# " + title_from_id(req.id) + "\n\n" + RULE_TEMPLATE_BODY + "\n";
    }

    if (opts_.dry_run) {
        log("[dry-run] Would create rules/" + record.file);
        log("[dry-run] Would add '" + req.id + "' to manifest and sync");
        return {};
    }

    writer_.write(path, content);
    log("Created rules/" + record.file);

    CursorMeta meta;
    meta.always_apply = req.always_apply;
    if (!req.description.empty()) meta.description = req.description;
    record.cursor = meta;
    m.rules.push_back(std::move(record));

    manifests_.write(m, writer_);
    std::cout << "\n";
    return sync(m);
}

SyncReport Engine::remove_rule(const std::string& id) {
    Manifest m = manifests_.read();
    const RuleRecord* rule = m.find_rule(id);
    if (!rule) {
        throw SyncError(SyncErrorKind::rule_not_found, "rule '" + id + "' not found in manifest");
    }
    SyncEngine(layout_, registry_, docs_, manifests_, writer_).validate(m);
    auto path = docs_.rule_path(*rule);

    if (opts_.dry_run) {
        log("[dry-run] Would remove rules/" + rule->file);
        log("[dry-run] Would remove '" + id + "' from manifest and sync");
        return {};
    }

    backups_.init_session("remove-rule");
    if (fs::exists(path)) {
        std::string file = rule->file;
        writer_.remove(path);
        log("Removed rules/" + file);
    }
    m.remove_rule(id);
    manifests_.write(m, writer_);
    std::cout << "\n";
    return sync(m);
}

// ── set ─────────────────────────────────────────────────────────────

void Engine::set(const std::string& key, const std::string& value) {
    backups_.begin_command("set");
    Manifest m = manifests_.read();
    apply_setting(m, key, value);
    manifests_.write(m, writer_);
    std::cout << "  Set " << key << " = " << setting_display(m, key) << "\n";
}

// ── clean ───────────────────────────────────────────────────────────

std::optional<CleanResult> Engine::clean() {
    Manifest m = manifests_.read();
    CleanPlan plan = plan_clean(m, registry_, layout_, backups_);

    if (plan.empty()) {
        std::cout << "\n  Nothing to clean -- no generated files or skill symlinks found.\n";
        return std::nullopt;
    }

    section_header("Generated rule files (" + std::to_string(plan.generated.size()) + ")");
    for (auto& f : plan.generated) {
        std::cout << "  " << f.string() << (plan.will_restore(f) ? " <- will restore from backup" : "") << "\n";
    }
    section_header("Skill symlinks (" + std::to_string(plan.links.size()) + ")");
    for (auto& s : plan.links) std::cout << "  " << s.string() << "\n";

    std::cout << "\n  Total: " << plan.generated.size() << " generated, "
              << plan.links.size() << " symlinks\n";
    if (!plan.restorable.empty()) {
        std::cout << "  " << plan.restorable.size() << " files will be restored from backup ("
                  << plan.session->name << ")\n";
    }
    std::cout << "  Your canonical source in " << layout_.root.string() << " is not affected.\n\n";

    if (!opts_.auto_confirm && !decisions_.confirm("  Proceed?", true)) {
        std::cout << "  Aborted.\n";
        return std::nullopt;
    }

    CleanResult result = execute_clean(plan, backups_, opts_);

    section_header("Summary");
    std::cout << "  " << result.removed_files << " generated removed, "
              << result.removed_links << " symlinks removed\n";
    if (result.restored > 0) std::cout << "  " << result.restored << " files restored from backup\n";
    if (opts_.dry_run) std::cout << "  (dry-run)\n";
    std::cout << "\n";
    return result;
}

// ── CLI entry points ────────────────────────────────────────────────

template <typename Fn>
static int run_command(Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

int cmd_init(Engine& engine) {
    return run_command([&] { return engine.init() ? 0 : 1; });
}

int cmd_sync(Engine& engine) {
    return run_command([&] { return engine.sync().ok() ? 0 : 1; });
}

int cmd_status(Engine& engine) {
    return run_command([&] {
        engine.status(std::cout);
        return 0;
    });
}

int cmd_reconfigure(Engine& engine) {
    return run_command([&] { return engine.reconfigure().ok() ? 0 : 1; });
}

int cmd_add_rule(Engine& engine, const AddRuleRequest& req) {
    return run_command([&] { return engine.add_rule(req).ok() ? 0 : 1; });
}

int cmd_remove_rule(Engine& engine, const std::string& id) {
    return run_command([&] { return engine.remove_rule(id).ok() ? 0 : 1; });
}

int cmd_set(Engine& engine, const std::string& key, const std::string& value) {
    return run_command([&] {
        engine.set(key, value);
        return 0;
    });
}

int cmd_clean(Engine& engine) {
    return run_command([&] {
        engine.clean();
        return 0;
    });
}

} // namespace agentsync
