#include "glob.hpp"
#include <algorithm>
#include <set>

namespace agentsync {

bool has_wildcard(const std::string& pattern) {
    return pattern.find_first_of("*?[") != std::string::npos;
}

// Matches a [...] class starting at pattern[pi] == '['. Sets `next` past ']'.
static bool match_class(const std::string& pattern, size_t pi, char c, size_t& next, bool& valid) {
    size_t i = pi + 1;
    bool negate = false;
    if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
        negate = true;
        i++;
    }
    bool matched = false;
    bool first = true;
    while (i < pattern.size() && (first || pattern[i] != ']')) {
        first = false;
        char lo = pattern[i];
        if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
            char hi = pattern[i + 2];
            if (c >= lo && c <= hi) matched = true;
            i += 3;
        } else {
            if (c == lo) matched = true;
            i++;
        }
    }
    if (i >= pattern.size()) {
        valid = false;   // unterminated: '[' is literal
        return false;
    }
    valid = true;
    next = i + 1;
    return matched != negate;
}

bool wildcard_match(const std::string& pattern, const std::string& name) {
    size_t p = 0, n = 0;
    size_t star_p = std::string::npos, star_n = 0;

    while (n < name.size()) {
        if (p < pattern.size()) {
            char pc = pattern[p];
            if (pc == '*') {
                star_p = p++;
                star_n = n;
                continue;
            }
            if (pc == '?') {
                p++;
                n++;
                continue;
            }
            if (pc == '[') {
                size_t next = 0;
                bool valid = false;
                bool ok = match_class(pattern, p, name[n], next, valid);
                if (valid && ok) {
                    p = next;
                    n++;
                    continue;
                }
                if (!valid && name[n] == '[') {
                    p++;
                    n++;
                    continue;
                }
            } else if (pc == name[n]) {
                p++;
                n++;
                continue;
            }
        }
        if (star_p == std::string::npos) return false;
        p = star_p + 1;
        n = ++star_n;
    }
    while (p < pattern.size() && pattern[p] == '*') p++;
    return p == pattern.size();
}

static bool is_hidden(const std::string& name) {
    return !name.empty() && name[0] == '.';
}

// All directories below `dir` (including `dir`), skipping hidden ones.
static std::vector<fs::path> walk_dirs(const fs::path& dir) {
    std::vector<fs::path> out{dir};
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(dir, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        auto name = it->path().filename().string();
        if (is_hidden(name)) {
            if (it->is_directory()) it.disable_recursion_pending();
            continue;
        }
        if (it->is_directory()) out.push_back(it->path());
    }
    return out;
}

std::vector<fs::path> expand_glob(const std::string& pattern) {
    fs::path pat(pattern);
    std::vector<fs::path> current{pat.is_absolute() ? pat.root_path() : fs::path(".")};
    std::vector<std::string> parts;
    for (auto& part : pat.relative_path()) {
        if (!part.empty()) parts.push_back(part.string());
    }

    for (size_t i = 0; i < parts.size(); i++) {
        const auto& part = parts[i];
        bool last = i + 1 == parts.size();
        std::vector<fs::path> next;

        if (part == "**") {
            for (auto& base : current) {
                std::error_code ec;
                if (!fs::is_directory(base, ec)) continue;
                for (auto& d : walk_dirs(base)) next.push_back(d);
            }
            if (last) {
                // Trailing "**" also yields the files below each directory.
                for (auto& base : current) {
                    std::error_code ec;
                    for (auto it = fs::recursive_directory_iterator(base, ec);
                         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
                        bool hidden = is_hidden(it->path().filename().string());
                        if (it->is_directory()) {
                            if (hidden) it.disable_recursion_pending();
                            continue;
                        }
                        if (!hidden) next.push_back(it->path());
                    }
                }
            }
        } else if (!has_wildcard(part)) {
            for (auto& base : current) {
                auto candidate = base / part;
                std::error_code ec;
                if (fs::exists(candidate, ec)) next.push_back(candidate);
            }
        } else {
            for (auto& base : current) {
                std::error_code ec;
                if (!fs::is_directory(base, ec)) continue;
                for (auto& entry : fs::directory_iterator(base, ec)) {
                    auto name = entry.path().filename().string();
                    if (is_hidden(name) && part[0] != '.') continue;
                    if (!last && !entry.is_directory()) continue;
                    if (wildcard_match(part, name)) next.push_back(entry.path());
                }
            }
        }
        current = std::move(next);
        if (current.empty()) break;
    }

    std::set<fs::path> unique;
    for (auto& p : current) unique.insert(pat.is_absolute() ? p : p.lexically_relative("."));
    return {unique.begin(), unique.end()};
}

} // namespace agentsync
