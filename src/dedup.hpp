#pragma once
#include "importers.hpp"
#include "options.hpp"
#include "prompt.hpp"
#include <vector>

namespace agentsync {

// Content at or below this similarity is a conflict, above it a duplicate.
inline constexpr double DUPLICATE_THRESHOLD = 0.8;

// Collapses rules sharing an id. The first-seen record wins duplicates and,
// unless the decision provider says otherwise, conflicts too.
// Output keeps first-occurrence order with at most one entry per id.
std::vector<ImportedRule> deduplicate_rules(const std::vector<ImportedRule>& rules,
                                            DecisionProvider& decisions,
                                            const RunOptions& opts);

} // namespace agentsync
