#include "dedup.hpp"
#include "text_diff.hpp"
#include <algorithm>
#include <map>

namespace agentsync {

std::vector<ImportedRule> deduplicate_rules(const std::vector<ImportedRule>& rules,
                                            DecisionProvider& decisions,
                                            const RunOptions& opts) {
    std::vector<ImportedRule> result;
    std::map<std::string, ImportedRule> seen;

    for (auto& rule : rules) {
        auto it = seen.find(rule.id);
        if (it == seen.end()) {
            seen.emplace(rule.id, rule);
            result.push_back(rule);
            continue;
        }

        const ImportedRule& existing = it->second;
        double ratio = similarity_ratio(existing.content, rule.content);
        if (ratio > DUPLICATE_THRESHOLD) {
            log("Duplicate: " + rule.id + " (" + existing.source + " ~ " + rule.source +
                ", " + std::to_string(static_cast<int>(ratio * 100)) + "% similar), keeping " +
                existing.source);
            continue;
        }

        log_warn("dedup", "conflict for '" + rule.id + "' between " + existing.source +
                 " and " + rule.source);
        if (opts.auto_confirm) {
            log("Keeping version from " + existing.source);
            continue;
        }

        std::cout << unified_diff(existing.content, rule.content,
                                  existing.source + "/" + rule.id,
                                  rule.source + "/" + rule.id);
        if (decisions.confirm("  Keep version from " + existing.source + "?", true)) continue;

        result.erase(std::remove_if(result.begin(), result.end(),
                                    [&](const ImportedRule& r) { return r.id == rule.id; }),
                     result.end());
        result.push_back(rule);
        it->second = rule;
    }
    return result;
}

} // namespace agentsync
