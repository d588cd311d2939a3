#include "generators.hpp"
#include "frontmatter.hpp"
#include "glob.hpp"
#include "marker.hpp"
#include <algorithm>
#include <set>

namespace agentsync {

// ── Rendering ───────────────────────────────────────────────────────

std::string render_frontmatter_rule(const RuleRecord& rule, const std::string& body,
                                    const std::string& header_block) {
    FrontMatter meta = FrontMatter::object();
    if (rule.cursor) {
        if (rule.cursor->description) meta["description"] = *rule.cursor->description;
        if (rule.cursor->always_apply) meta["alwaysApply"] = *rule.cursor->always_apply;
        if (rule.cursor->globs) meta["globs"] = *rule.cursor->globs;
    }
    std::string fm = meta.empty() ? "---\n---" : build_frontmatter(meta);
    return fm + "\n\n" + header_block + "\n" + body;
}

std::string render_headed_concat(const std::vector<std::pair<std::string, std::string>>& rules,
                                 const std::string& header_block) {
    std::vector<std::string> parts{header_block, ""};
    for (auto& [id, body] : rules) {
        parts.push_back("## Rule: " + id + "\n");
        parts.push_back(body);
        parts.push_back("");
    }
    return join(parts, "\n");
}

std::string render_plain_concat(const std::vector<std::string>& bodies,
                                const std::string& header_block) {
    std::vector<std::string> parts{header_block, ""};
    for (auto& body : bodies) {
        parts.push_back(body);
        parts.push_back("");
    }
    return join(parts, "\n");
}

std::string rule_summary(const RuleRecord& rule, const std::optional<std::string>& body) {
    if (rule.cursor && rule.cursor->description && !rule.cursor->description->empty()) {
        return *rule.cursor->description;
    }
    if (body) {
        for (auto& line : split_lines(*body)) {
            auto stripped = trim(line);
            if (!stripped.empty() && stripped[0] != '#') return stripped.substr(0, SUMMARY_MAX_LEN);
        }
    }
    return rule.id;
}

std::string render_numbered_summary(const AgentsMdConfig& config,
                                    const std::vector<std::pair<std::string, std::string>>& id_summaries,
                                    const std::string& header_block) {
    std::string header = config.header.empty() ? DEFAULT_AGENTS_HEADER : config.header;
    std::vector<std::string> lines{header_block, header, ""};
    if (!config.preamble.empty()) {
        lines.push_back(config.preamble);
        lines.push_back("");
    }
    int n = 1;
    for (auto& [id, summary] : id_summaries) {
        lines.push_back(std::to_string(n++) + ". **" + id + "** -- " + summary);
    }
    lines.push_back("");
    return join(lines, "\n");
}

static fs::path to_output_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p, ec) ? p / "AGENTS.md" : p;
}

std::vector<fs::path> expand_output_paths(const std::vector<std::string>& patterns,
                                          const fs::path& home) {
    std::vector<fs::path> out;
    for (auto& raw : patterns) {
        std::string expanded = expand_path(raw, home.string());
        if (!has_wildcard(expanded)) {
            out.push_back(to_output_file(expanded));
            continue;
        }
        auto matches = expand_glob(expanded);
        if (matches.empty()) log_warn("agents-md", "glob '" + raw + "' matched no files");
        for (auto& m : matches) out.push_back(to_output_file(m));
    }
    return out;
}

// ── Generators ──────────────────────────────────────────────────────

static std::string header_block(const GenerateContext& ctx) {
    return generated_header_block(ctx.timestamp);
}

static void gen_frontmatter_dir(const ConsumerTarget& consumer, const Manifest& manifest,
                                GenerateContext& ctx, GenerateResult& result) {
    const fs::path& dir = *consumer.rules_dir;
    auto rules = manifest.rules_for(consumer.id);
    std::set<std::string> active;

    for (auto& rule : rules) {
        active.insert(rule.id);
        auto path = dir / (rule.id + consumer.rules_ext);
        auto content = render_frontmatter_rule(rule, ctx.store.read_rule(rule), header_block(ctx));
        if (ctx.writer.write(path, content)) result.files_written++;
        result.outputs.push_back(path);
    }

    // Stale cleanup: only files this tool generated
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return;
    std::vector<fs::path> stale;
    for (auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file() || entry.path().extension().string() != consumer.rules_ext) continue;
        if (active.count(entry.path().stem().string())) continue;
        if (is_generated(parse_frontmatter(read_file(entry.path())).body)) stale.push_back(entry.path());
    }
    std::sort(stale.begin(), stale.end());
    for (auto& path : stale) {
        if (ctx.writer.remove(path)) {
            result.files_removed++;
            log("Removed stale " + path.filename().string());
        }
    }
}

static void gen_headed_concat(const ConsumerTarget& consumer, const Manifest& manifest,
                              GenerateContext& ctx, GenerateResult& result) {
    std::vector<std::pair<std::string, std::string>> rules;
    for (auto& rule : manifest.rules_for(consumer.id)) {
        rules.emplace_back(rule.id, ctx.store.read_rule(rule));
    }
    if (ctx.writer.write(*consumer.rules_file, render_headed_concat(rules, header_block(ctx)))) {
        result.files_written++;
    }
    result.outputs.push_back(*consumer.rules_file);
}

static void gen_plain_concat(const ConsumerTarget& consumer, const Manifest& manifest,
                             GenerateContext& ctx, GenerateResult& result) {
    std::vector<std::string> bodies;
    for (auto& rule : manifest.rules_for(consumer.id)) bodies.push_back(ctx.store.read_rule(rule));
    if (ctx.writer.write(*consumer.rules_file, render_plain_concat(bodies, header_block(ctx)))) {
        result.files_written++;
    }
    result.outputs.push_back(*consumer.rules_file);
}

static void gen_numbered_summary(const ConsumerTarget& consumer, const Manifest& manifest,
                                 GenerateContext& ctx, GenerateResult& result) {
    if (manifest.agents_md.paths.empty()) {
        log(consumer.label + ": no paths configured, skipping");
        return;
    }
    auto targets = expand_output_paths(manifest.agents_md.paths, ctx.layout.home);
    if (targets.empty()) return;

    std::vector<std::pair<std::string, std::string>> summaries;
    for (auto& rule : manifest.rules_for(consumer.id)) {
        std::optional<std::string> body;
        if (ctx.store.rule_file_exists(rule.file)) body = ctx.store.read_rule(rule);
        summaries.emplace_back(rule.id, rule_summary(rule, body));
    }
    auto content = render_numbered_summary(manifest.agents_md, summaries, header_block(ctx));
    for (auto& path : targets) {
        if (ctx.writer.write(path, content)) result.files_written++;
        result.outputs.push_back(path);
    }
}

std::optional<LinkReport> sync_consumer_skills(const ConsumerTarget& consumer, GenerateContext& ctx) {
    if (!consumer.skills_dir) return std::nullopt;
    std::error_code ec;
    if (!fs::is_directory(ctx.store.skills_dir(), ec)) return std::nullopt;
    return reconcile_skill_links(*consumer.skills_dir, ctx.store.skills_dir(), ctx.writer);
}

GenerateResult generate(const ConsumerTarget& consumer, const Manifest& manifest,
                        GenerateContext& ctx, bool link_skills) {
    GenerateResult result;
    switch (consumer.generate_shape) {
        case GenerateShape::frontmatter_dir:
            gen_frontmatter_dir(consumer, manifest, ctx, result);
            break;
        case GenerateShape::headed_concat:
            gen_headed_concat(consumer, manifest, ctx, result);
            break;
        case GenerateShape::plain_concat:
            gen_plain_concat(consumer, manifest, ctx, result);
            break;
        case GenerateShape::numbered_summary:
            gen_numbered_summary(consumer, manifest, ctx, result);
            break;
        case GenerateShape::skills_only:
            break;
    }
    if (link_skills) result.skills = sync_consumer_skills(consumer, ctx);
    return result;
}

} // namespace agentsync
