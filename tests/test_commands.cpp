#include <gtest/gtest.h>
#include <algorithm>
#include <functional>
#include <memory>
#include <sstream>
#include "commands.hpp"
#include "errors.hpp"
#include "marker.hpp"
#include "test_support.hpp"

using namespace agentsync;

class CommandsTest : public TempHome {
protected:
    RunOptions opts;
    AutoDecisions autos;

    std::unique_ptr<Engine> engine() { return engine(autos); }
    std::unique_ptr<Engine> engine(DecisionProvider& decisions) {
        return std::make_unique<Engine>(layout, opts, decisions);
    }

    static Manifest targets(const std::vector<std::string>& rules,
                            const std::vector<std::string>& skills = {}) {
        Manifest m;
        m.active_targets.rules = rules;
        m.active_targets.set_skill_names(skills);
        return m;
    }

    static SyncErrorKind kind_of(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const SyncError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected SyncError";
        return SyncErrorKind::not_initialized;
    }

    bool is_link(const fs::path& p) const { return fs::is_symlink(fs::symlink_status(p)); }
};

// Switches the process working directory for one scope.
struct WorkingDirectory {
    fs::path saved = fs::current_path();
    explicit WorkingDirectory(const fs::path& dir) { fs::current_path(dir); }
    ~WorkingDirectory() {
        std::error_code ec;
        fs::current_path(saved, ec);
    }
};

// ── sync ────────────────────────────────────────────────────────────

TEST_F(CommandsTest, SyncWritesEveryActiveRuleTarget) {
    seed(targets({"cursor", "codex"}), {{"rule-a", "# A\nContent.\n"}});

    EXPECT_EQ(cmd_sync(*engine()), 0);

    auto mdc = slurp(home / ".cursor/rules/rule-a.mdc");
    EXPECT_NE(mdc.find(GENERATED_HEADER), std::string::npos);
    EXPECT_NE(mdc.find("Content."), std::string::npos);

    auto codex = slurp(home / ".codex/model-instructions.md");
    EXPECT_TRUE(is_generated(codex));
    EXPECT_NE(codex.find("## Rule: rule-a"), std::string::npos);
    EXPECT_NE(codex.find("Content."), std::string::npos);

    EXPECT_EQ(read_manifest().updated, utc_date_str());
}

TEST_F(CommandsTest, SyncOnlyIgnoresInactiveTarget) {
    seed(targets({"cursor"}), {{"rule-a", "A\n"}});
    opts.only = "claude";

    auto report = engine()->sync();
    EXPECT_EQ(report.rule_targets, 0);
    EXPECT_EQ(report.skill_targets, 0);
    EXPECT_FALSE(fs::exists(home / ".cursor/rules/rule-a.mdc"));
    EXPECT_FALSE(fs::exists(home / ".claude/CLAUDE.md"));
}

TEST_F(CommandsTest, SyncOnlyRestrictsToOneConsumer) {
    seed(targets({"cursor", "claude"}), {{"rule-a", "A\n"}});
    opts.only = "claude";

    auto report = engine()->sync();
    EXPECT_EQ(report.rule_targets, 1);
    EXPECT_TRUE(fs::exists(home / ".claude/CLAUDE.md"));
    EXPECT_FALSE(fs::exists(home / ".cursor/rules/rule-a.mdc"));
}

TEST_F(CommandsTest, SyncFailureKeepsOtherTargetsAndSkipsManifest) {
    seed(targets({"cursor", "codex"}), {{"rule-a", "A\n"}});
    fs::create_directories(home / ".codex/model-instructions.md");

    auto report = engine()->sync();
    EXPECT_FALSE(report.ok());
    EXPECT_EQ(report.failures, (std::vector<std::string>{"codex"}));
    EXPECT_FALSE(report.persisted);
    EXPECT_TRUE(fs::exists(home / ".cursor/rules/rule-a.mdc"));
    EXPECT_EQ(read_manifest().updated, "2000-01-01");

    EXPECT_EQ(cmd_sync(*engine()), 1);
}

TEST_F(CommandsTest, SyncWritesRelativeAgentsMdPathInWorkingDirectory) {
    auto m = targets({"agents-md"});
    m.agents_md.paths = {"AGENTS.md"};
    seed(m, {{"rule-a", "# A\nContent.\n"}});

    SyncReport report;
    {
        WorkingDirectory cwd(home);
        report = engine()->sync();
    }
    EXPECT_TRUE(report.ok());
    EXPECT_TRUE(report.persisted);

    auto text = slurp(home / "AGENTS.md");
    EXPECT_TRUE(is_generated(text));
    EXPECT_NE(text.find("1. **rule-a** -- Content."), std::string::npos);
}

TEST_F(CommandsTest, SyncEngineEndsInDonePhase) {
    seed(targets({"claude"}), {{"rule-a", "A\n"}});
    BackupManager backups(layout, opts);
    FileWriter writer(opts, backups);
    DocumentStore docs(layout);
    ManifestStore manifests(layout);
    SyncEngine sync(layout, registry, docs, manifests, writer);
    EXPECT_TRUE(sync.phase() == SyncPhase::idle);

    Manifest m = manifests.read();
    EXPECT_TRUE(sync.run(m).persisted);
    EXPECT_TRUE(sync.phase() == SyncPhase::done);
}

TEST_F(CommandsTest, SyncWithoutManifestIsNotInitialized) {
    EXPECT_EQ(kind_of([&] { engine()->sync(); }), SyncErrorKind::not_initialized);
    EXPECT_EQ(cmd_sync(*engine()), 1);
    EXPECT_FALSE(fs::exists(layout.root));
}

TEST_F(CommandsTest, SyncRejectsUnknownOnlyBeforeWriting) {
    seed(targets({"cursor"}), {{"rule-a", "A\n"}});
    auto before = snapshot();
    opts.only = "vim";

    EXPECT_EQ(kind_of([&] { engine()->sync(); }), SyncErrorKind::unknown_consumer);
    EXPECT_EQ(snapshot(), before);
}

TEST_F(CommandsTest, SyncLinksSkillOnlyTargets) {
    seed(targets({"cursor"}, {"antigravity"}), {{"rule-a", "A\n"}});
    put(".ai-agent/skills/s1/SKILL.md", "skill\n");

    auto report = engine()->sync();
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.skill_targets, 1);
    EXPECT_EQ(report.links_created, 1);
    EXPECT_TRUE(is_link(home / ".gemini/antigravity/skills/s1"));
    EXPECT_FALSE(fs::exists(home / ".cursor/skills/s1"));
}

// ── add-rule / remove-rule ──────────────────────────────────────────

TEST_F(CommandsTest, AddRuleCreatesFileAndRecord) {
    seed(targets({"cursor"}), {});
    AddRuleRequest req;
    req.id = "new-rule";
    req.description = "A new rule";

    EXPECT_EQ(cmd_add_rule(*engine(), req), 0);

    auto m = read_manifest();
    const RuleRecord* rule = m.find_rule("new-rule");
    ASSERT_NE(rule, nullptr);
    EXPECT_EQ(rule->imported_from, "manual");
    ASSERT_TRUE(rule->cursor.has_value());
    EXPECT_EQ(rule->cursor->description.value_or(""), "A new rule");
    EXPECT_TRUE(rule->cursor->always_apply.value_or(false));

    auto body = slurp(layout.rules_dir() / "new-rule.md");
    EXPECT_TRUE(starts_with(body, "# New Rule\n"));
    EXPECT_TRUE(fs::exists(home / ".cursor/rules/new-rule.mdc"));

    auto before = snapshot();
    EXPECT_EQ(kind_of([&] { engine()->add_rule(req); }), SyncErrorKind::duplicate_rule_id);
    EXPECT_EQ(snapshot(), before);
}

TEST_F(CommandsTest, AddRuleFromFileWithExclusions) {
    seed(targets({"cursor", "claude"}), {});
    put("notes/body.md", "# Imported\nFrom a file.\n");
    AddRuleRequest req;
    req.id = "imported";
    req.from_file = "~/notes/body.md";
    req.exclude = "claude";
    req.always_apply = false;

    ASSERT_TRUE(engine()->add_rule(req).ok());
    EXPECT_EQ(slurp(layout.rules_dir() / "imported.md"), "# Imported\nFrom a file.\n");
    EXPECT_TRUE(fs::exists(home / ".cursor/rules/imported.mdc"));
    EXPECT_EQ(read_file(home / ".claude/CLAUDE.md").find("From a file."), std::string::npos);
    EXPECT_EQ(read_manifest().find_rule("imported")->exclude, (std::vector<std::string>{"claude"}));
}

TEST_F(CommandsTest, AddRuleRejectsUnknownExclusion) {
    seed(targets({"cursor"}), {});
    AddRuleRequest req;
    req.id = "x";
    req.exclude = "vim";

    EXPECT_EQ(kind_of([&] { engine()->add_rule(req); }), SyncErrorKind::unknown_consumer);
    EXPECT_FALSE(fs::exists(layout.rules_dir() / "x.md"));
    EXPECT_FALSE(read_manifest().has_rule("x"));
}

TEST_F(CommandsTest, AddRuleRejectsPathLikeIds) {
    seed(targets({"cursor"}), {});
    AddRuleRequest req;
    req.id = "../escape";
    EXPECT_EQ(cmd_add_rule(*engine(), req), 1);
    EXPECT_FALSE(fs::exists(layout.root / "escape.md"));
}

TEST_F(CommandsTest, RemoveRuleDeletesFileRecordAndOutput) {
    seed(targets({"cursor"}), {{"rule-a", "A\n"}, {"rule-b", "B\n"}});
    ASSERT_EQ(cmd_sync(*engine()), 0);
    ASSERT_TRUE(fs::exists(home / ".cursor/rules/rule-b.mdc"));

    EXPECT_EQ(cmd_remove_rule(*engine(), "rule-b"), 0);
    EXPECT_FALSE(fs::exists(layout.rules_dir() / "rule-b.md"));
    EXPECT_FALSE(read_manifest().has_rule("rule-b"));
    EXPECT_FALSE(fs::exists(home / ".cursor/rules/rule-b.mdc"));
    EXPECT_TRUE(fs::exists(home / ".cursor/rules/rule-a.mdc"));
}

TEST_F(CommandsTest, RemoveUnknownRule) {
    seed(targets({"cursor"}), {{"rule-a", "A\n"}});
    EXPECT_EQ(kind_of([&] { engine()->remove_rule("nope"); }), SyncErrorKind::rule_not_found);
    EXPECT_EQ(cmd_remove_rule(*engine(), "nope"), 1);
}

// ── set / status / reconfigure ──────────────────────────────────────

TEST_F(CommandsTest, SetUpdatesSettableKeysOnly) {
    seed(targets({"cursor"}), {});
    EXPECT_EQ(cmd_set(*engine(), "agents_md.paths", "~/a,~/b"), 0);
    EXPECT_EQ(read_manifest().agents_md.paths, (std::vector<std::string>{"~/a", "~/b"}));

    auto before = snapshot();
    EXPECT_EQ(kind_of([&] { engine()->set("active_targets.rules", "claude"); }),
              SyncErrorKind::unsupported_key);
    EXPECT_EQ(cmd_set(*engine(), "version", "2"), 1);
    EXPECT_EQ(snapshot(), before);
}

TEST_F(CommandsTest, StatusListsRulesTargetsAndSyncDate) {
    auto m = targets({"cursor", "claude"}, {"codex"});
    seed(m, {{"rule-a", "A\n"}});
    put(".ai-agent/skills/deploy/SKILL.md", "x\n");

    std::ostringstream out;
    engine()->status(out);
    auto text = out.str();
    EXPECT_NE(text.find("Rules (1)"), std::string::npos);
    EXPECT_NE(text.find("rule-a"), std::string::npos);
    EXPECT_NE(text.find("cursor, claude"), std::string::npos);
    EXPECT_NE(text.find("deploy"), std::string::npos);
    EXPECT_NE(text.find("(none configured)"), std::string::npos);
    EXPECT_NE(text.find("Last Synced"), std::string::npos);
    EXPECT_NE(text.find("2000-01-01"), std::string::npos);
}

TEST_F(CommandsTest, ReconfigureReplacesTargetsAndSyncs) {
    seed(targets({"cursor"}, {"cursor"}), {{"rule-a", "A\n"}});
    ScriptedDecisions scripted;
    scripted.selections = {{"claude"}, {"codex"}};

    EXPECT_EQ(cmd_reconfigure(*engine(scripted)), 0);
    auto m = read_manifest();
    EXPECT_EQ(m.active_targets.rules, (std::vector<std::string>{"claude"}));
    EXPECT_EQ(m.active_targets.skill_names(), (std::vector<std::string>{"codex"}));
    EXPECT_TRUE(is_generated(slurp(home / ".claude/CLAUDE.md")));
}

// ── init ────────────────────────────────────────────────────────────

TEST_F(CommandsTest, InitImportsDetectedSources) {
    put(".claude/CLAUDE.md", "# Style\nUse tabs.\n");
    put(".cursor/rules/brief.mdc", "---\nalwaysApply: true\n---\nBe brief.\n");
    put(".cursor/skills/s1/SKILL.md", "skill\n");
    opts.auto_confirm = true;

    EXPECT_EQ(cmd_init(*engine()), 0);

    auto m = read_manifest();
    EXPECT_EQ(m.imported_from, (std::vector<std::string>{"cursor", "claude"}));
    ASSERT_EQ(m.rules.size(), 2u);
    EXPECT_EQ(m.rules[0].id, "brief");
    EXPECT_TRUE(m.rules[0].cursor && m.rules[0].cursor->always_apply.value_or(false));
    EXPECT_EQ(m.rules[1].id, "style");
    EXPECT_EQ(slurp(layout.rules_dir() / "style.md"), "# Style\nUse tabs.\n");

    EXPECT_TRUE(fs::is_regular_file(layout.skills_dir() / "s1/SKILL.md"));
    EXPECT_FALSE(is_link(layout.skills_dir() / "s1"));
    EXPECT_FALSE(is_link(home / ".cursor/skills/s1"));
    EXPECT_TRUE(is_link(home / ".codex/skills/s1"));

    auto claude = slurp(home / ".claude/CLAUDE.md");
    EXPECT_TRUE(is_generated(claude));
    EXPECT_NE(claude.find("Use tabs."), std::string::npos);

    RunOptions plain;
    BackupManager backups(layout, plain);
    auto session = backups.latest_session();
    ASSERT_TRUE(session.has_value());
    auto originals = backups.mirrored_originals(*session);
    EXPECT_NE(std::find(originals.begin(), originals.end(), home / ".claude/CLAUDE.md"), originals.end());
}

TEST_F(CommandsTest, InitFollowsScriptedSelections) {
    put(".claude/CLAUDE.md", "# Style\nUse tabs.\n\n# Tests\nWrite tests.\n");
    ScriptedDecisions scripted;
    scripted.selections = {{"claude"}, {"style"}, {"claude"}, {}};

    EXPECT_TRUE(engine(scripted)->init());

    auto m = read_manifest();
    ASSERT_EQ(m.rules.size(), 1u);
    EXPECT_EQ(m.rules[0].id, "style");
    EXPECT_EQ(m.active_targets.rules, (std::vector<std::string>{"claude"}));
    EXPECT_TRUE(m.active_targets.skills.empty());
    EXPECT_FALSE(fs::exists(layout.rules_dir() / "tests.md"));

    auto claude = slurp(home / ".claude/CLAUDE.md");
    EXPECT_NE(claude.find("Use tabs."), std::string::npos);
    EXPECT_EQ(claude.find("Write tests."), std::string::npos);
}

TEST_F(CommandsTest, InitFromOneSourceMergesRepeatedHeadings) {
    put(".claude/CLAUDE.md", "# Style\nUse tabs.\n\n# Style\nUse spaces everywhere.\n");
    opts.auto_confirm = true;

    EXPECT_EQ(cmd_init(*engine()), 0);

    auto m = read_manifest();
    auto count = std::count_if(m.rules.begin(), m.rules.end(),
                               [](const RuleRecord& r) { return r.id == "style"; });
    EXPECT_EQ(count, 1);
    EXPECT_EQ(slurp(layout.rules_dir() / "style.md"), "# Style\nUse tabs.\n");
}

TEST_F(CommandsTest, InitWithNoSourcesAborts) {
    ScriptedDecisions scripted;
    scripted.selections.push_back({});
    EXPECT_TRUE(engine(scripted)->init());
    EXPECT_FALSE(fs::exists(layout.manifest_path()));
}

// ── clean ───────────────────────────────────────────────────────────

TEST_F(CommandsTest, CleanRemovesOutputsAndRestoresOriginals) {
    const std::string original = "# Mine\nOriginal text.\n";
    put(".claude/CLAUDE.md", original);
    put(".ai-agent/skills/s1/SKILL.md", "skill\n");
    seed(targets({"claude"}, {"cursor"}), {{"rule-a", "A\n"}});

    ASSERT_EQ(cmd_sync(*engine()), 0);
    ASSERT_TRUE(is_generated(slurp(home / ".claude/CLAUDE.md")));
    ASSERT_TRUE(is_link(home / ".cursor/skills/s1"));

    opts.auto_confirm = true;
    auto result = engine()->clean();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->removed_files, 1);
    EXPECT_EQ(result->removed_links, 1);
    EXPECT_EQ(result->restored, 1);

    EXPECT_EQ(slurp(home / ".claude/CLAUDE.md"), original);
    EXPECT_FALSE(is_link(home / ".cursor/skills/s1"));
    EXPECT_TRUE(fs::is_regular_file(layout.skills_dir() / "s1/SKILL.md"));
    EXPECT_TRUE(fs::exists(layout.rules_dir() / "rule-a.md"));
}

TEST_F(CommandsTest, CleanKeepsUserFiles) {
    put(".cursor/rules/mine.mdc", "---\n---\nMine\n");
    seed(targets({"cursor"}), {{"rule-a", "A\n"}});
    ASSERT_EQ(cmd_sync(*engine()), 0);

    opts.auto_confirm = true;
    EXPECT_EQ(cmd_clean(*engine()), 0);
    EXPECT_FALSE(fs::exists(home / ".cursor/rules/rule-a.mdc"));
    EXPECT_EQ(slurp(home / ".cursor/rules/mine.mdc"), "---\n---\nMine\n");
}

TEST_F(CommandsTest, CleanDeclinedChangesNothing) {
    seed(targets({"cursor"}), {{"rule-a", "A\n"}});
    ASSERT_EQ(cmd_sync(*engine()), 0);
    auto before = snapshot();

    ScriptedDecisions scripted;
    scripted.confirms = {false};
    EXPECT_FALSE(engine(scripted)->clean().has_value());
    EXPECT_EQ(snapshot(), before);
}

// ── dry-run ─────────────────────────────────────────────────────────

TEST_F(CommandsTest, DryRunLeavesFilesystemUntouched) {
    put(".claude/CLAUDE.md", "# Mine\nText.\n");
    put(".ai-agent/skills/s1/SKILL.md", "skill\n");
    seed(targets({"cursor", "claude"}, {"codex"}), {{"rule-a", "A\n"}, {"rule-b", "B\n"}});
    ASSERT_EQ(cmd_sync(*engine()), 0);
    write_file_or_throw(layout.rules_dir() / "rule-a.md", "A changed\n");

    auto before = snapshot();
    opts.dry_run = true;
    opts.auto_confirm = true;

    EXPECT_EQ(cmd_sync(*engine()), 0);
    EXPECT_EQ(snapshot(), before);

    AddRuleRequest req;
    req.id = "new-rule";
    EXPECT_EQ(cmd_add_rule(*engine(), req), 0);
    EXPECT_EQ(snapshot(), before);

    EXPECT_EQ(cmd_remove_rule(*engine(), "rule-b"), 0);
    EXPECT_EQ(snapshot(), before);

    EXPECT_EQ(cmd_set(*engine(), "agents_md.header", "# Other"), 0);
    EXPECT_EQ(snapshot(), before);

    EXPECT_EQ(cmd_clean(*engine()), 0);
    EXPECT_EQ(snapshot(), before);

    EXPECT_EQ(cmd_init(*engine()), 0);
    EXPECT_EQ(snapshot(), before);

    ScriptedDecisions scripted;
    scripted.selections = {{"gemini"}, {"antigravity"}};
    EXPECT_EQ(cmd_reconfigure(*engine(scripted)), 0);
    EXPECT_EQ(snapshot(), before);
}
