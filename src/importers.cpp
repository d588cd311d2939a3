#include "importers.hpp"
#include "frontmatter.hpp"
#include "marker.hpp"
#include "options.hpp"
#include <algorithm>

namespace agentsync {

static std::vector<fs::path> files_with_ext(const fs::path& dir, const std::string& ext) {
    std::vector<fs::path> files;
    for (auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        if (entry.path().extension().string() != ext) continue;
        files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());
    return files;
}

static std::string line_count(const std::string& text) {
    return "(" + std::to_string(split_lines(text).size()) + " lines)";
}

static std::optional<std::string> meta_string(const FrontMatter& meta, const char* key) {
    if (!meta.contains(key)) return std::nullopt;
    auto& v = meta[key];
    if (v.is_string()) return v.get<std::string>();
    if (v.is_boolean()) return std::string(v.get<bool>() ? "true" : "false");
    return v.dump();
}

// ── Per-file rules with metadata ────────────────────────────────────

std::vector<ImportedRule> import_frontmatter_dir(const ConsumerTarget& consumer) {
    std::vector<ImportedRule> rules;
    if (!consumer.rules_dir || !fs::is_directory(*consumer.rules_dir)) {
        log(consumer.label + ": no rules directory found, skipping");
        return rules;
    }

    for (auto& path : files_with_ext(*consumer.rules_dir, consumer.rules_ext)) {
        auto doc = parse_frontmatter(read_file_or_throw(path));
        std::string name = path.filename().string();
        if (is_generated(doc.body)) {
            log(consumer.label + ": skipping generated file " + name);
            continue;
        }

        ImportedRule rule;
        rule.id = path.stem().string();
        rule.content = doc.body;
        rule.source = consumer.id;

        CursorMeta meta;
        if (doc.meta.contains("alwaysApply") && doc.meta["alwaysApply"].is_boolean()) {
            meta.always_apply = doc.meta["alwaysApply"].get<bool>();
        }
        meta.description = meta_string(doc.meta, "description");
        meta.globs = meta_string(doc.meta, "globs");
        if (!meta.empty()) rule.cursor_meta = meta;

        log(consumer.label + ": imported " + name + " " + line_count(doc.body));
        rules.push_back(std::move(rule));
    }
    return rules;
}

// ── Single file, "## Source: <name>" sections ───────────────────────

static const std::string SOURCE_MARKER = "## Source:";

static std::string strip_known_ext(const std::string& name) {
    for (const char* ext : {".mdc", ".md"}) {
        if (ends_with(name, ext) && name.size() > std::char_traits<char>::length(ext)) {
            return name.substr(0, name.size() - std::char_traits<char>::length(ext));
        }
    }
    return name;
}

// Reads a single rules file; returns nullopt when absent or generated.
static std::optional<std::string> read_source_file(const ConsumerTarget& consumer) {
    if (!consumer.rules_file || !fs::is_regular_file(*consumer.rules_file)) {
        std::string name = consumer.rules_file ? consumer.rules_file->filename().string() : "rules file";
        log(consumer.label + ": no " + name + " found, skipping");
        return std::nullopt;
    }
    std::string text = read_file_or_throw(*consumer.rules_file);
    if (is_generated(text)) {
        log(consumer.label + ": skipping generated " + consumer.rules_file->filename().string());
        return std::nullopt;
    }
    return text;
}

std::vector<ImportedRule> import_source_sections(const ConsumerTarget& consumer) {
    std::vector<ImportedRule> rules;
    auto text = read_source_file(consumer);
    if (!text) return rules;

    std::string header;
    std::string body;
    bool in_section = false;

    auto flush = [&]() {
        if (!in_section) return;
        ImportedRule rule;
        rule.id = strip_known_ext(header);
        rule.content = trim(body);
        rule.source = consumer.id;
        if (is_generated(rule.content)) {
            log(consumer.label + ": skipping generated section '" + header + "'");
        } else {
            log(consumer.label + ": imported section '" + header + "' " + line_count(rule.content));
            rules.push_back(std::move(rule));
        }
    };

    for (auto& line : split_lines(*text)) {
        if (starts_with(line, SOURCE_MARKER)) {
            std::string name = trim(line.substr(SOURCE_MARKER.size()));
            if (!name.empty()) {
                flush();
                header = name;
                body.clear();
                in_section = true;
                continue;
            }
        }
        // Text before the first marker is preamble and is dropped.
        if (in_section) body += line + "\n";
    }
    flush();
    return rules;
}

// ── Single file, "# <heading>" sections ─────────────────────────────

static bool is_top_heading(const std::string& line) {
    return line.size() > 2 && line[0] == '#' && line[1] == ' ';
}

std::vector<ImportedRule> import_heading_sections(const ConsumerTarget& consumer) {
    std::vector<ImportedRule> rules;
    auto text = read_source_file(consumer);
    if (!text) return rules;

    std::string heading_line;
    std::string body;
    bool in_section = false;

    auto flush = [&]() {
        if (!in_section) return;
        size_t start = heading_line.find_first_not_of("# ");
        std::string heading = start == std::string::npos ? "" : trim(heading_line.substr(start));
        std::string content = trim(body);

        ImportedRule rule;
        rule.id = slugify(heading);
        rule.content = trim(heading_line + "\n" + content);
        rule.source = consumer.id;
        if (rule.id.empty()) {
            log_warn("import", consumer.label + ": heading '" + heading_line + "' has no usable id, skipping");
            return;
        }
        log(consumer.label + ": imported '" + heading + "' " + line_count(content));
        rules.push_back(std::move(rule));
    };

    for (auto& line : split_lines(*text)) {
        if (is_top_heading(line)) {
            flush();
            heading_line = line;
            body.clear();
            in_section = true;
            continue;
        }
        if (in_section) body += line + "\n";
    }
    flush();
    return rules;
}

// ── Flat directory of plain files ───────────────────────────────────

std::vector<ImportedRule> import_flat_dir(const ConsumerTarget& consumer) {
    std::vector<ImportedRule> rules;
    if (!consumer.import_dir || !fs::is_directory(*consumer.import_dir)) {
        log(consumer.label + ": no " +
            (consumer.import_dir ? consumer.import_dir->filename().string() : std::string("rules")) +
            " directory found, skipping");
        return rules;
    }

    for (auto& path : files_with_ext(*consumer.import_dir, consumer.import_ext)) {
        std::string text = read_file_or_throw(path);
        std::string name = path.filename().string();
        if (is_generated(text)) {
            log(consumer.label + ": skipping generated file " + name);
            continue;
        }
        ImportedRule rule;
        rule.id = path.stem().string();
        rule.content = trim(text);
        rule.source = consumer.id;
        log(consumer.label + ": imported " + name + " " + line_count(text));
        rules.push_back(std::move(rule));
    }
    return rules;
}

// ── Skills ──────────────────────────────────────────────────────────

std::vector<fs::path> scan_skill_dirs(const fs::path& skills_dir) {
    std::vector<fs::path> result;
    std::error_code ec;
    if (!fs::is_directory(skills_dir, ec)) return result;

    for (auto& entry : fs::directory_iterator(skills_dir)) {
        if (entry.is_symlink()) continue;
        if (!entry.is_directory()) continue;
        if (is_reserved_skill_name(entry.path().filename().string())) continue;
        result.push_back(entry.path());
    }
    std::sort(result.begin(), result.end());
    return result;
}

int import_skills(const std::vector<fs::path>& skill_dirs, const fs::path& canonical_dir,
                  FileWriter& writer) {
    writer.create_directories(canonical_dir);
    int count = 0;
    for (auto& src : skill_dirs) {
        auto name = src.filename().string();
        auto dest = canonical_dir / name;
        if (fs::exists(dest)) {
            log_verbose(writer.options(), "Skill '" + name + "' already exists, skipping");
            continue;
        }
        if (writer.copy_directory(src, dest)) {
            if (!writer.options().dry_run) log("Copied skill: " + name);
            count++;
        }
    }
    return count;
}

// ── Dispatch ────────────────────────────────────────────────────────

ImportResult import_consumer(const ConsumerTarget& consumer) {
    ImportResult result;
    switch (consumer.import_shape) {
        case ImportShape::frontmatter_dir:
            result.rules = import_frontmatter_dir(consumer);
            break;
        case ImportShape::source_sections:
            result.rules = import_source_sections(consumer);
            break;
        case ImportShape::heading_sections:
            result.rules = import_heading_sections(consumer);
            break;
        case ImportShape::flat_dir:
            result.rules = import_flat_dir(consumer);
            break;
        case ImportShape::none:
            return result;
    }
    if (consumer.skills_dir) result.skill_dirs = scan_skill_dirs(*consumer.skills_dir);
    return result;
}

std::string rule_preview(const std::string& content, size_t max_len) {
    for (auto& line : split_lines(content)) {
        std::string stripped = trim(line);
        if (!stripped.empty() && stripped[0] != '#') {
            return stripped.substr(0, max_len);
        }
    }
    return "(empty)";
}

} // namespace agentsync
