#include <gtest/gtest.h>
#include "importers.hpp"
#include "marker.hpp"
#include "test_support.hpp"

using namespace agentsync;

namespace {

std::vector<std::string> ids(const std::vector<ImportedRule>& rules) {
    std::vector<std::string> out;
    for (auto& r : rules) out.push_back(r.id);
    return out;
}

std::string generated(const std::string& body) {
    return generated_header_block("2026-01-01T00:00:00Z") + body;
}

} // namespace

class ImportersTest : public TempHome {
protected:
    RunOptions opts;
};

TEST_F(ImportersTest, FrontmatterDirReadsSortedFilesAndKnownKeys) {
    put(".cursor/rules/b.mdc",
        "---\nalwaysApply: true\ndescription: Style guide\nfoo: bar\n---\n# B\nBody\n");
    put(".cursor/rules/a.mdc", "# A\nPlain\n");
    put(".cursor/rules/c.mdc", "---\n---\n\n" + generated("# C\n"));
    put(".cursor/rules/notes.txt", "ignored");

    auto rules = import_frontmatter_dir(consumer("cursor"));
    ASSERT_EQ(ids(rules), (std::vector<std::string>{"a", "b"}));
    EXPECT_FALSE(rules[0].cursor_meta.has_value());
    EXPECT_EQ(rules[0].content, "# A\nPlain\n");

    ASSERT_TRUE(rules[1].cursor_meta.has_value());
    EXPECT_EQ(rules[1].cursor_meta->always_apply.value_or(false), true);
    EXPECT_EQ(rules[1].cursor_meta->description.value_or(""), "Style guide");
    EXPECT_FALSE(rules[1].cursor_meta->globs.has_value());
    EXPECT_EQ(rules[1].content, "# B\nBody\n");
    EXPECT_EQ(rules[1].source, "cursor");
}

TEST_F(ImportersTest, SourceSectionsSplitOnMarkerAndStripExtension) {
    put(".codex/model-instructions.md",
        "Preamble text\n## Source: style.mdc\nUse tabs.\n\n## Source: tests.md\nWrite tests.\n");
    auto rules = import_source_sections(consumer("codex"));
    ASSERT_EQ(ids(rules), (std::vector<std::string>{"style", "tests"}));
    EXPECT_EQ(rules[0].content, "Use tabs.");
    EXPECT_EQ(rules[1].content, "Write tests.");
}

TEST_F(ImportersTest, GeneratedSingleFileIsSkipped) {
    put(".codex/model-instructions.md", generated("\n## Rule: a\n\nA\n"));
    EXPECT_TRUE(import_source_sections(consumer("codex")).empty());
}

TEST_F(ImportersTest, HeadingSectionsSlugifyAndKeepHeading) {
    put(".claude/CLAUDE.md",
        "intro ignored\n# Code Style!\nUse tabs.\n## Details\nMore.\n\n# Testing\nWrite tests.\n#NotHeading\n");
    auto rules = import_heading_sections(consumer("claude"));
    ASSERT_EQ(ids(rules), (std::vector<std::string>{"code-style", "testing"}));
    EXPECT_EQ(rules[0].content, "# Code Style!\nUse tabs.\n## Details\nMore.");
    EXPECT_EQ(rules[1].content, "# Testing\nWrite tests.\n#NotHeading");
}

TEST_F(ImportersTest, HeadingWithoutUsableIdIsSkipped) {
    put(".gemini/GEMINI.md", "# !!!\nx\n# Real\ny\n");
    EXPECT_EQ(ids(import_heading_sections(consumer("gemini"))), (std::vector<std::string>{"real"}));
}

TEST_F(ImportersTest, FlatDirUsesStemAndTrimmedText) {
    put(".kiro/steering/b.md", "  Rule B  \n\n");
    put(".kiro/steering/a.md", "Rule A\n");
    put(".kiro/steering/conventions.md", generated("Rule A\n"));
    auto rules = import_flat_dir(consumer("kiro"));
    ASSERT_EQ(ids(rules), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(rules[1].content, "Rule B");
}

TEST_F(ImportersTest, MissingSourcesYieldNothing) {
    for (auto& id : registry.importer_ids()) {
        auto result = import_consumer(consumer(id));
        EXPECT_TRUE(result.rules.empty()) << id;
        EXPECT_TRUE(result.skill_dirs.empty()) << id;
    }
}

TEST_F(ImportersTest, SkillScanSkipsLinksReservedNamesAndFiles) {
    auto skills = home / ".cursor" / "skills";
    for (auto name : {"beta", "alpha", ".system", "cursor-migration-map", "pattern-x"}) {
        fs::create_directories(skills / name);
    }
    put(".cursor/skills/readme.txt", "x");
    fs::create_directories(home / "elsewhere");
    fs::create_directory_symlink(home / "elsewhere", skills / "linked");

    auto found = scan_skill_dirs(skills);
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].filename().string(), "alpha");
    EXPECT_EQ(found[1].filename().string(), "beta");
}

TEST_F(ImportersTest, ImportSkillsCopiesOnceAndKeepsExisting) {
    put(".cursor/skills/alpha/SKILL.md", "from cursor");
    put(".cursor/skills/beta/SKILL.md", "from cursor");
    put(".ai-agent/skills/beta/SKILL.md", "canonical");

    BackupManager backups(layout, opts);
    FileWriter writer(opts, backups);
    int copied = import_skills(scan_skill_dirs(home / ".cursor" / "skills"), layout.skills_dir(), writer);

    EXPECT_EQ(copied, 1);
    EXPECT_EQ(slurp(layout.skills_dir() / "alpha" / "SKILL.md"), "from cursor");
    EXPECT_EQ(slurp(layout.skills_dir() / "beta" / "SKILL.md"), "canonical");
}

TEST(RulePreview, FirstNonHeadingLine) {
    EXPECT_EQ(rule_preview("# Title\n\n  First line here  \nSecond\n"), "First line here");
    EXPECT_EQ(rule_preview("# Only heading\n\n"), "(empty)");
    EXPECT_EQ(rule_preview(""), "(empty)");
    EXPECT_EQ(rule_preview(std::string(100, 'x')), std::string(80, 'x'));
}
