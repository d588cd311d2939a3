#pragma once
#include <string>
#include <vector>
#include <cstdlib>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <chrono>
#include <ctime>
#include <stdexcept>

namespace agentsync {

namespace fs = std::filesystem;

inline std::string home_dir() {
#ifdef _WIN32
    const char* h = std::getenv("USERPROFILE");
    if (!h) h = std::getenv("HOMEDRIVE");
#else
    const char* h = std::getenv("HOME");
#endif
    return h ? std::string(h) : ".";
}

inline std::string expand_path(const std::string& p, const std::string& home) {
    if (p == "~") return home;
    if (p.size() >= 2 && p[0] == '~' && (p[1] == '/' || p[1] == '\\')) {
        return home + p.substr(1);
    }
    return p;
}

// Returns "" when the file cannot be opened.
inline std::string read_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return "";
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

inline std::string read_file_or_throw(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("Cannot read file: " + path.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

inline void write_file_or_throw(const fs::path& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) throw std::runtime_error("Cannot write file: " + path.string());
    f << content;
    if (!f) throw std::runtime_error("Failed writing file: " + path.string());
}

inline std::string utc_format(const char* fmt) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), fmt, &tm);
    return buf;
}

// 2026-10-17
inline std::string utc_date_str() { return utc_format("%Y-%m-%d"); }

// 2026-10-17T09:30:00Z
inline std::string utc_iso_str() { return utc_format("%Y-%m-%dT%H:%M:%SZ"); }

// 20261017T093000Z, sorts lexicographically in time order
inline std::string utc_compact_str() { return utc_format("%Y%m%dT%H%M%SZ"); }

// ── String helpers ──────────────────────────────────────────────────

inline std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

inline std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Splits on '\n'; a trailing "\r" is dropped from each line.
inline std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

// "a, b,,c" -> {"a", "b", "c"}
inline std::vector<std::string> split_csv(const std::string& value) {
    std::vector<std::string> out;
    std::istringstream stream(value);
    std::string part;
    while (std::getline(stream, part, ',')) {
        part = trim(part);
        if (!part.empty()) out.push_back(part);
    }
    return out;
}

inline std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

// "My Rule: v2!" -> "my-rule-v2"
inline std::string slugify(const std::string& text) {
    std::string out;
    bool prev_dash = false;
    for (char c : to_lower(text)) {
        bool alnum = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
        if (alnum) {
            out += c;
            prev_dash = false;
        } else if (!prev_dash) {
            out += '-';
            prev_dash = true;
        }
    }
    while (!out.empty() && out.front() == '-') out.erase(out.begin());
    while (!out.empty() && out.back() == '-') out.pop_back();
    return out;
}

// "new-rule" -> "New Rule"
inline std::string title_from_id(const std::string& id) {
    std::string out;
    bool at_word_start = true;
    for (char c : id) {
        if (c == '-') c = ' ';
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            out += static_cast<char>(at_word_start ? std::toupper(uc) : std::tolower(uc));
            at_word_start = false;
        } else {
            out += c;
            at_word_start = true;
        }
    }
    return out;
}

// True when `path` equals `base` or lies below it (component-wise).
inline bool path_within(const fs::path& path, const fs::path& base) {
    auto p = path.lexically_normal();
    auto b = base.lexically_normal();
    auto pit = p.begin();
    for (auto bit = b.begin(); bit != b.end(); ++bit) {
        if (bit->empty()) continue;
        if (pit == p.end() || *pit != *bit) return false;
        ++pit;
    }
    return true;
}

} // namespace agentsync
