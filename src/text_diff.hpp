#pragma once
#include <string>
#include <vector>
#include <algorithm>

namespace agentsync {

struct MatchBlock {
    size_t a = 0;
    size_t b = 0;
    size_t size = 0;
};

enum class OpTag { equal, replace, remove, insert };

struct OpCode {
    OpTag tag;
    size_t i1, i2, j1, j2;
};

// Longest-matching-block alignment over two random-access sequences.
// No junk heuristics: every element participates in matching.
template <typename Seq>
class SequenceMatcher {
public:
    SequenceMatcher(const Seq& a, const Seq& b) : a_(a), b_(b) {}

    std::vector<MatchBlock> matching_blocks() const {
        std::vector<MatchBlock> found;
        std::vector<std::pair<std::pair<size_t, size_t>, std::pair<size_t, size_t>>> queue;
        queue.push_back({{0, a_.size()}, {0, b_.size()}});

        while (!queue.empty()) {
            auto [ra, rb] = queue.back();
            queue.pop_back();
            auto [alo, ahi] = ra;
            auto [blo, bhi] = rb;
            MatchBlock m = longest_match(alo, ahi, blo, bhi);
            if (m.size == 0) continue;
            found.push_back(m);
            if (alo < m.a && blo < m.b) {
                queue.push_back({{alo, m.a}, {blo, m.b}});
            }
            if (m.a + m.size < ahi && m.b + m.size < bhi) {
                queue.push_back({{m.a + m.size, ahi}, {m.b + m.size, bhi}});
            }
        }

        std::sort(found.begin(), found.end(), [](const MatchBlock& x, const MatchBlock& y) {
            return x.a != y.a ? x.a < y.a : x.b < y.b;
        });

        // Merge adjacent blocks
        std::vector<MatchBlock> merged;
        for (auto& m : found) {
            if (!merged.empty()) {
                auto& last = merged.back();
                if (last.a + last.size == m.a && last.b + last.size == m.b) {
                    last.size += m.size;
                    continue;
                }
            }
            merged.push_back(m);
        }
        merged.push_back({a_.size(), b_.size(), 0});
        return merged;
    }

    std::vector<OpCode> opcodes() const {
        std::vector<OpCode> out;
        size_t i = 0, j = 0;
        for (auto& m : matching_blocks()) {
            if (i < m.a && j < m.b) out.push_back({OpTag::replace, i, m.a, j, m.b});
            else if (i < m.a) out.push_back({OpTag::remove, i, m.a, j, m.b});
            else if (j < m.b) out.push_back({OpTag::insert, i, m.a, j, m.b});
            i = m.a + m.size;
            j = m.b + m.size;
            if (m.size > 0) out.push_back({OpTag::equal, m.a, i, m.b, j});
        }
        return out;
    }

    // 2*M / T, where M is the number of matched elements and T the total length.
    double ratio() const {
        size_t total = a_.size() + b_.size();
        if (total == 0) return 1.0;
        size_t matches = 0;
        for (auto& m : matching_blocks()) matches += m.size;
        return 2.0 * static_cast<double>(matches) / static_cast<double>(total);
    }

private:
    const Seq& a_;
    const Seq& b_;

    // Earliest longest common run inside a_[alo,ahi) x b_[blo,bhi).
    MatchBlock longest_match(size_t alo, size_t ahi, size_t blo, size_t bhi) const {
        MatchBlock best{alo, blo, 0};
        if (alo >= ahi || blo >= bhi) return best;
        std::vector<size_t> prev(bhi - blo + 1, 0), cur(bhi - blo + 1, 0);
        for (size_t i = alo; i < ahi; i++) {
            for (size_t j = blo; j < bhi; j++) {
                size_t k = 0;
                if (a_[i] == b_[j]) {
                    k = prev[j - blo] + 1;
                    if (k > best.size) {
                        best = {i + 1 - k, j + 1 - k, k};
                    }
                }
                cur[j - blo + 1] = k;
            }
            std::swap(prev, cur);
        }
        return best;
    }
};

// Character-level similarity in [0,1]. Identical strings give 1.0.
double similarity_ratio(const std::string& a, const std::string& b);

// Unified diff of two texts (3 lines of context). Empty when they are equal.
std::string unified_diff(const std::string& before, const std::string& after,
                         const std::string& from_label, const std::string& to_label);

} // namespace agentsync
