#pragma once
#include <iostream>
#include <string>

namespace agentsync {

// Flags shared by every command. Computed once per invocation.
struct RunOptions {
    bool dry_run = false;
    bool show_diff = false;
    bool verbose = false;
    bool auto_confirm = false;
    std::string only;   // restrict sync to one consumer (empty = all)
};

// ── Console output ──────────────────────────────────────────────────

inline void log(const std::string& msg) {
    std::cout << "  " << msg << "\n";
}

inline void log_verbose(const RunOptions& opts, const std::string& msg) {
    if (opts.verbose) std::cout << "  [verbose] " << msg << "\n";
}

inline void log_warn(const std::string& tag, const std::string& msg) {
    std::cerr << "[" << tag << "] Warning: " << msg << "\n";
}

inline void log_error(const std::string& tag, const std::string& msg) {
    std::cerr << "[" << tag << "] Error: " << msg << "\n";
}

inline void section_header(const std::string& title) {
    const size_t width = 50;
    size_t fill = title.size() + 5 < width ? width - title.size() - 5 : 1;
    std::string rule;
    for (size_t i = 0; i < fill; i++) rule += "─";
    std::cout << "\n─── " << title << " " << rule << "\n";
}

inline void summary_line(const std::string& label, size_t count, const std::string& detail = "") {
    std::string padded = label;
    if (padded.size() < 15) padded.resize(15, ' ');
    std::cout << "  " << padded << " " << count;
    if (!detail.empty()) std::cout << "  (" << detail << ")";
    std::cout << "\n";
}

} // namespace agentsync
