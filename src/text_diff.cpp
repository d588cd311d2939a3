#include "text_diff.hpp"
#include <sstream>

namespace agentsync {

double similarity_ratio(const std::string& a, const std::string& b) {
    return SequenceMatcher<std::string>(a, b).ratio();
}

// Lines keep their trailing '\n' so a missing final newline shows up in the diff.
static std::vector<std::string> split_keep_ends(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start + 1));
        start = nl + 1;
    }
    return lines;
}

static std::string format_range(size_t start, size_t stop) {
    size_t beginning = start + 1;
    size_t length = stop - start;
    if (length == 1) return std::to_string(beginning);
    if (length == 0) beginning -= 1;
    return std::to_string(beginning) + "," + std::to_string(length);
}

static std::vector<std::vector<OpCode>> grouped_opcodes(std::vector<OpCode> codes, size_t n) {
    std::vector<std::vector<OpCode>> groups;
    if (codes.empty()) codes.push_back({OpTag::equal, 0, 1, 0, 1});

    auto& first = codes.front();
    if (first.tag == OpTag::equal) {
        first.i1 = std::max(first.i1, first.i2 >= n ? first.i2 - n : 0);
        first.j1 = std::max(first.j1, first.j2 >= n ? first.j2 - n : 0);
    }
    auto& last = codes.back();
    if (last.tag == OpTag::equal) {
        last.i2 = std::min(last.i2, last.i1 + n);
        last.j2 = std::min(last.j2, last.j1 + n);
    }

    std::vector<OpCode> group;
    for (auto code : codes) {
        if (code.tag == OpTag::equal && code.i2 - code.i1 > 2 * n) {
            group.push_back({OpTag::equal, code.i1, std::min(code.i2, code.i1 + n),
                             code.j1, std::min(code.j2, code.j1 + n)});
            groups.push_back(group);
            group.clear();
            code.i1 = std::max(code.i1, code.i2 - n);
            code.j1 = std::max(code.j1, code.j2 - n);
        }
        group.push_back(code);
    }
    if (!group.empty() && !(group.size() == 1 && group[0].tag == OpTag::equal)) {
        groups.push_back(group);
    }
    return groups;
}

static void emit_line(std::ostringstream& out, char prefix, const std::string& line) {
    out << prefix << line;
    if (line.empty() || line.back() != '\n') out << "\n";
}

std::string unified_diff(const std::string& before, const std::string& after,
                         const std::string& from_label, const std::string& to_label) {
    auto a = split_keep_ends(before);
    auto b = split_keep_ends(after);
    SequenceMatcher<std::vector<std::string>> matcher(a, b);

    std::ostringstream out;
    bool started = false;
    for (auto& group : grouped_opcodes(matcher.opcodes(), 3)) {
        if (!started) {
            out << "--- " << from_label << "\n";
            out << "+++ " << to_label << "\n";
            started = true;
        }
        auto& first = group.front();
        auto& last = group.back();
        out << "@@ -" << format_range(first.i1, last.i2)
            << " +" << format_range(first.j1, last.j2) << " @@\n";

        for (auto& code : group) {
            if (code.tag == OpTag::equal) {
                for (size_t i = code.i1; i < code.i2; i++) emit_line(out, ' ', a[i]);
                continue;
            }
            if (code.tag == OpTag::replace || code.tag == OpTag::remove) {
                for (size_t i = code.i1; i < code.i2; i++) emit_line(out, '-', a[i]);
            }
            if (code.tag == OpTag::replace || code.tag == OpTag::insert) {
                for (size_t j = code.j1; j < code.j2; j++) emit_line(out, '+', b[j]);
            }
        }
    }
    return out.str();
}

} // namespace agentsync
