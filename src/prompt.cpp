#include "prompt.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>

namespace agentsync {

static std::string label_for(const SelectOptions& options, const std::string& id) {
    for (auto& [oid, label] : options) {
        if (oid == id) return label;
    }
    return id;
}

// ── AutoDecisions ───────────────────────────────────────────────────

std::vector<std::string> AutoDecisions::multi_select(const std::string& prompt,
                                                     const SelectOptions& options,
                                                     const std::vector<std::string>& defaults) {
    if (options.empty()) return {};
    std::cout << "\n" << prompt << "\n";
    for (auto& id : defaults) {
        std::cout << "  [auto] " << label_for(options, id) << "\n";
    }
    return defaults;
}

// ── ConsoleDecisions ────────────────────────────────────────────────

std::string ConsoleDecisions::read_line() {
    std::string line;
    if (!std::getline(in_, line)) return "";
    return trim(line);
}

bool ConsoleDecisions::confirm(const std::string& prompt, bool default_yes) {
    out_ << prompt << (default_yes ? " [Y/n] " : " [y/N] ") << std::flush;
    std::string answer = to_lower(read_line());
    if (answer.empty()) return default_yes;
    return answer == "y" || answer == "yes";
}

std::vector<std::string> ConsoleDecisions::multi_select(const std::string& prompt,
                                                        const SelectOptions& options,
                                                        const std::vector<std::string>& defaults) {
    if (options.empty()) return {};

    out_ << "\n" << prompt << "\n";
    for (size_t i = 0; i < options.size(); i++) {
        bool marked = std::find(defaults.begin(), defaults.end(), options[i].first) != defaults.end();
        out_ << "  " << (i + 1) << ". [" << (marked ? "*" : " ") << "] " << options[i].second << "\n";
    }
    if (!defaults.empty()) {
        out_ << "\n  (* = detected/suggested, press Enter to accept defaults)\n";
    }
    out_ << "\n  Select (comma-separated numbers, or 'all'): " << std::flush;

    std::string raw = read_line();
    if (raw.empty()) return defaults;

    std::vector<std::string> selected;
    if (to_lower(raw) == "all") {
        for (auto& [id, _] : options) selected.push_back(id);
        return selected;
    }
    for (auto& part : split_csv(raw)) {
        bool numeric = std::all_of(part.begin(), part.end(),
                                   [](unsigned char c) { return std::isdigit(c) != 0; });
        if (part.size() > 6 || !numeric) continue;
        size_t idx = std::stoul(part);
        if (idx >= 1 && idx <= options.size()) {
            auto& id = options[idx - 1].first;
            if (std::find(selected.begin(), selected.end(), id) == selected.end()) {
                selected.push_back(id);
            }
        }
    }
    return selected;
}

std::string ConsoleDecisions::ask(const std::string& prompt, const std::string& default_value) {
    out_ << prompt << " " << std::flush;
    std::string answer = read_line();
    return answer.empty() ? default_value : answer;
}

} // namespace agentsync
