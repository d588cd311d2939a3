#pragma once
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace agentsync {

// (id, label) pairs offered to a multi-select.
using SelectOptions = std::vector<std::pair<std::string, std::string>>;

// Source of user decisions. The engine never reads the terminal directly.
class DecisionProvider {
public:
    virtual ~DecisionProvider() = default;
    virtual bool confirm(const std::string& prompt, bool default_yes) = 0;
    virtual std::vector<std::string> multi_select(const std::string& prompt,
                                                  const SelectOptions& options,
                                                  const std::vector<std::string>& defaults) = 0;
    virtual std::string ask(const std::string& prompt, const std::string& default_value) = 0;
};

// Answers every question with its default (--yes, tool wrappers).
class AutoDecisions : public DecisionProvider {
public:
    bool confirm(const std::string&, bool default_yes) override { return default_yes; }
    std::vector<std::string> multi_select(const std::string& prompt,
                                          const SelectOptions& options,
                                          const std::vector<std::string>& defaults) override;
    std::string ask(const std::string&, const std::string& default_value) override {
        return default_value;
    }
};

// Line-oriented prompts on an input stream.
class ConsoleDecisions : public DecisionProvider {
public:
    explicit ConsoleDecisions(std::istream& in = std::cin, std::ostream& out = std::cout)
        : in_(in), out_(out) {}

    bool confirm(const std::string& prompt, bool default_yes) override;
    std::vector<std::string> multi_select(const std::string& prompt,
                                          const SelectOptions& options,
                                          const std::vector<std::string>& defaults) override;
    std::string ask(const std::string& prompt, const std::string& default_value) override;

private:
    std::istream& in_;
    std::ostream& out_;

    std::string read_line();
};

} // namespace agentsync
