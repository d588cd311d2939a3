#include "frontmatter.hpp"
#include "utils.hpp"
#include <sstream>

namespace agentsync {

static bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Matches "key: value" where key is [A-Za-z0-9_]+ and value is non-empty.
static bool split_key_value(const std::string& line, std::string& key, std::string& value) {
    size_t i = 0;
    while (i < line.size() && is_word_char(line[i])) i++;
    if (i == 0) return false;
    key = line.substr(0, i);

    while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) i++;
    if (i >= line.size() || line[i] != ':') return false;
    i++;

    value = trim(line.substr(i));
    return !value.empty();
}

static nlohmann::ordered_json coerce_value(const std::string& val) {
    std::string lower = to_lower(val);
    if (lower == "true") return true;
    if (lower == "false") return false;

    if ((val.front() == '"' && val.back() == '"') ||
        (val.front() == '\'' && val.back() == '\'')) {
        return val.size() >= 2 ? val.substr(1, val.size() - 2) : std::string();
    }
    return val;
}

ParsedDocument parse_frontmatter(const std::string& text) {
    ParsedDocument doc;
    if (!starts_with(text, "---")) {
        doc.body = text;
        return doc;
    }

    auto end = text.find("---", 3);
    if (end == std::string::npos) {
        doc.body = text;
        return doc;
    }

    std::string block = trim(text.substr(3, end - 3));
    size_t body_start = end + 3;
    while (body_start < text.size() && text[body_start] == '\n') body_start++;
    doc.body = text.substr(body_start);

    for (auto& raw : split_lines(block)) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') continue;

        std::string key, value;
        if (!split_key_value(line, key, value)) continue;
        doc.meta[key] = coerce_value(value);
    }
    return doc;
}

std::string build_frontmatter(const FrontMatter& meta) {
    std::ostringstream out;
    out << "---\n";
    for (auto& [key, value] : meta.items()) {
        if (value.is_boolean()) {
            out << key << ": " << (value.get<bool>() ? "true" : "false") << "\n";
        } else if (value.is_string()) {
            auto s = value.get<std::string>();
            if (s.find_first_of(" :\"") != std::string::npos) {
                out << key << ": \"" << s << "\"\n";
            } else {
                out << key << ": " << s << "\n";
            }
        } else {
            out << key << ": " << value.dump() << "\n";
        }
    }
    out << "---";
    return out.str();
}

} // namespace agentsync
