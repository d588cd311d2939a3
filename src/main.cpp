#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "commands.hpp"

static void print_usage() {
    std::cout << "Usage: agentsync <command> [options]\n\n"
              << "Commands:\n"
              << "  init                        Import existing agent rules into ~/.ai-agent\n"
              << "  sync                        Regenerate every active target\n"
              << "  reconfigure                 Choose rule and skill targets again\n"
              << "  status                      Show rules, targets and skills\n"
              << "  clean                       Remove generated files, restore originals\n"
              << "  add-rule ID [-d DESC] [--no-always-apply] [--file PATH] [--exclude A,B]\n"
              << "                              Create a canonical rule and sync\n"
              << "  remove-rule ID              Delete a canonical rule and sync\n"
              << "  set KEY VALUE               Update a manifest setting\n\n"
              << "Options:\n"
              << "  --dry-run                   Show what would change, touch nothing\n"
              << "  --diff                      Print a unified diff before each write\n"
              << "  --verbose                   Detailed progress\n"
              << "  --yes, -y                   Accept every default without prompting\n"
              << "  --only AGENT                Restrict sync to one agent\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    if (cmd == "-h" || cmd == "--help" || cmd == "help") {
        print_usage();
        return 0;
    }

    // Global flags may appear anywhere after the command.
    agentsync::RunOptions opts;
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--dry-run") {
            opts.dry_run = true;
        } else if (a == "--diff") {
            opts.show_diff = true;
        } else if (a == "--verbose" || a == "-v") {
            opts.verbose = true;
        } else if (a == "--yes" || a == "-y") {
            opts.auto_confirm = true;
        } else if (a == "--only" && i + 1 < argc) {
            opts.only = argv[++i];
        } else {
            args.push_back(a);
        }
    }

    std::unique_ptr<agentsync::DecisionProvider> decisions;
    if (opts.auto_confirm) {
        decisions = std::make_unique<agentsync::AutoDecisions>();
    } else {
        decisions = std::make_unique<agentsync::ConsoleDecisions>();
    }
    agentsync::Engine engine(agentsync::Layout::from_env(), opts, *decisions);

    if (cmd == "init") {
        return agentsync::cmd_init(engine);
    }
    else if (cmd == "sync") {
        return agentsync::cmd_sync(engine);
    }
    else if (cmd == "reconfigure") {
        return agentsync::cmd_reconfigure(engine);
    }
    else if (cmd == "status") {
        return agentsync::cmd_status(engine);
    }
    else if (cmd == "clean") {
        return agentsync::cmd_clean(engine);
    }
    else if (cmd == "add-rule") {
        agentsync::AddRuleRequest req;
        for (size_t i = 0; i < args.size(); i++) {
            if ((args[i] == "-d" || args[i] == "--description") && i + 1 < args.size()) {
                req.description = args[++i];
            } else if (args[i] == "--file" && i + 1 < args.size()) {
                req.from_file = args[++i];
            } else if (args[i] == "--exclude" && i + 1 < args.size()) {
                req.exclude = args[++i];
            } else if (args[i] == "--no-always-apply") {
                req.always_apply = false;
            } else if (req.id.empty()) {
                req.id = args[i];
            }
        }
        if (req.id.empty()) {
            std::cerr << "Usage: agentsync add-rule ID [options]\n";
            return 1;
        }
        return agentsync::cmd_add_rule(engine, req);
    }
    else if (cmd == "remove-rule") {
        if (args.empty()) {
            std::cerr << "Usage: agentsync remove-rule ID\n";
            return 1;
        }
        return agentsync::cmd_remove_rule(engine, args[0]);
    }
    else if (cmd == "set") {
        if (args.size() < 2) {
            std::cerr << "Usage: agentsync set KEY VALUE\n";
            return 1;
        }
        return agentsync::cmd_set(engine, args[0], args[1]);
    }
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }
}
