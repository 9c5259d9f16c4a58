//! # CLI Command Dispatcher
//!
//! ```text
//! maplint_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ check          → run_check()
//!   ├─ fix            → run_fix()
//!   ├─ explain        → run_explain()
//!   └─ rules          → run_rules()
//! ```
//!
//! Logging flags (`-v`, `--log-level=`, ...) may appear anywhere and are
//! removed before the command sees its arguments.

#include "cli/commands/cmd_check.hpp"
#include "cli/commands/cmd_explain.hpp"
#include "cli/commands/cmd_fix.hpp"
#include "cli/commands/cmd_rules.hpp"
#include "cli/driver.hpp"
#include "cli/terminal.hpp"
#include "cli/utils.hpp"
#include "maplint/log/log.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace maplint::cli {

static const std::vector<std::string>& known_commands() {
    static const std::vector<std::string> commands = {"check", "fix", "explain", "rules"};
    return commands;
}

static int dispatch(const std::string& command, const std::vector<std::string>& args) {
    if (command == "--help" || command == "-h" || command == "help") {
        print_usage();
        return EXIT_OK;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return EXIT_OK;
    }

    if (command == "check") {
        return run_check(args);
    }

    if (command == "fix") {
        return run_fix(args);
    }

    if (command == "explain") {
        if (args.size() != 1) {
            std::cerr << "Usage: maplint explain <rule-code>\n";
            return EXIT_USAGE;
        }
        return run_explain(args[0]);
    }

    if (command == "rules") {
        return run_rules();
    }

    std::cerr << "error: unknown command '" << command << "'\n";
    auto similar = find_similar_candidates(command, known_commands(), 1, 2);
    if (!similar.empty()) {
        std::cerr << "Did you mean `maplint " << similar.front() << "`?\n";
    }
    std::cerr << "Run `maplint --help` for usage.\n";
    return EXIT_USAGE;
}

int maplint_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        if (!log::is_log_option(argv[i])) {
            args.emplace_back(argv[i]);
        }
    }

    if (args.empty()) {
        print_usage();
        return EXIT_OK;
    }

    std::string command = args.front();
    args.erase(args.begin());

    int code = EXIT_USAGE;
    try {
        code = dispatch(command, args);
    } catch (const std::exception& e) {
        MAPLINT_LOG_FATAL("check", "Internal error: " << e.what());
        std::cerr << "error: internal error: " << e.what() << "\n";
    }
    log::Logger::instance().flush();
    return code;
}

} // namespace maplint::cli
