#pragma once
#include <gtest/gtest.h>
#include <deque>
#include <map>
#include <random>
#include "consumers.hpp"
#include "layout.hpp"
#include "manifest.hpp"
#include "prompt.hpp"
#include "store.hpp"

namespace agentsync {

// Scratch home directory per test; the canonical root lives below it.
class TempHome : public ::testing::Test {
protected:
    fs::path home;
    Layout layout;
    ConsumerRegistry registry{std::vector<ConsumerTarget>{}};

    void SetUp() override {
        std::random_device rd;
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = std::string("agentsync-") + info->test_suite_name() + "-" +
                           info->name() + "-" + std::to_string(rd());
        home = fs::temp_directory_path() / name;
        fs::create_directories(home);
        layout = Layout::for_home(home);
        home = layout.home;
        registry = ConsumerRegistry::make_default(layout.home);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(home, ec);
    }

    fs::path put(const fs::path& rel, const std::string& content) {
        auto path = home / rel;
        fs::create_directories(path.parent_path());
        write_file_or_throw(path, content);
        return path;
    }

    std::string slurp(const fs::path& path) const { return read_file_or_throw(path); }

    const ConsumerTarget& consumer(const std::string& id) const { return registry.require(id); }

    // Writes canonical rule files and the manifest directly, bypassing the engine.
    void seed(Manifest m, const std::map<std::string, std::string>& bodies) {
        fs::create_directories(layout.rules_dir());
        for (auto& [id, body] : bodies) {
            write_file_or_throw(layout.rules_dir() / (id + ".md"), body);
            if (!m.has_rule(id)) {
                RuleRecord r;
                r.id = id;
                r.file = id + ".md";
                r.imported_from = "test";
                m.rules.push_back(r);
            }
        }
        if (m.updated.empty()) m.updated = "2000-01-01";
        write_file_or_throw(layout.manifest_path(), ManifestStore::serialize(m));
    }

    Manifest read_manifest() const { return ManifestStore(layout).read(); }

    // Every entry below the home directory: content for files, target for links.
    std::map<std::string, std::string> snapshot() const {
        std::map<std::string, std::string> out;
        for (auto& entry : fs::recursive_directory_iterator(home)) {
            auto rel = entry.path().lexically_relative(home).string();
            if (entry.is_symlink()) {
                out[rel] = "link:" + fs::read_symlink(entry.path()).string();
            } else if (entry.is_directory()) {
                out[rel] = "dir";
            } else {
                out[rel] = "file:" + read_file(entry.path());
            }
        }
        return out;
    }
};

// Answers from queues; an empty queue falls back to the default.
class ScriptedDecisions : public DecisionProvider {
public:
    std::deque<bool> confirms;
    std::deque<std::vector<std::string>> selections;
    std::deque<std::string> answers;
    std::vector<std::string> prompts;

    bool confirm(const std::string& prompt, bool default_yes) override {
        prompts.push_back(prompt);
        if (confirms.empty()) return default_yes;
        bool v = confirms.front();
        confirms.pop_front();
        return v;
    }

    std::vector<std::string> multi_select(const std::string& prompt, const SelectOptions&,
                                          const std::vector<std::string>& defaults) override {
        prompts.push_back(prompt);
        if (selections.empty()) return defaults;
        auto v = selections.front();
        selections.pop_front();
        return v;
    }

    std::string ask(const std::string& prompt, const std::string& default_value) override {
        prompts.push_back(prompt);
        if (answers.empty()) return default_value;
        auto v = answers.front();
        answers.pop_front();
        return v;
    }
};

} // namespace agentsync
