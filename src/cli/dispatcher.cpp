//! # CLI Command Dispatcher
//!
//! Entry point of the `knit` executable. Configures logging from the command
//! line, then routes to the command handler.
//!
//! ```text
//! knit_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ json           → run_json()
//!   └─ nginx          → run_nginx()
//! ```
//!
//! Logging options (`--log-level=`, `-v`, ...) are accepted anywhere on the
//! command line and are removed before the command arguments are read.

#include "cmd_json.hpp"
#include "cmd_nginx.hpp"
#include "driver.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace knit::cli {

namespace {

struct CommandArgs {
    std::vector<std::string> positional;
    std::vector<std::string> flags;

    bool has_flag(const std::string& flag) const {
        for (const auto& f : flags) {
            if (f == flag)
                return true;
        }
        return false;
    }
};

CommandArgs split_args(int argc, char* argv[]) {
    CommandArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (log::is_log_option(arg)) {
            continue;
        }
        if (arg.size() > 1 && arg[0] == '-') {
            args.flags.push_back(arg);
        } else {
            args.positional.push_back(arg);
        }
    }
    return args;
}

/// Reports flags the command does not understand. Returns false if any.
bool check_flags(const CommandArgs& args, const std::vector<std::string>& known) {
    bool ok = true;
    for (const auto& flag : args.flags) {
        bool found = false;
        for (const auto& k : known) {
            if (flag == k)
                found = true;
        }
        if (!found) {
            std::cerr << "error: unknown option '" << flag << "'\n";
            ok = false;
        }
    }
    return ok;
}

} // namespace

/// Main entry point for the knit CLI.
///
/// ## Return Codes
///
/// | Code | Meaning                                          |
/// |------|--------------------------------------------------|
/// | 0    | Success                                          |
/// | 1    | Usage error, unreadable file or malformed input  |
int knit_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    auto args = split_args(argc, argv);

    if (args.has_flag("--help") || args.has_flag("-h")) {
        print_usage();
        return 0;
    }

    if (args.has_flag("--version") || args.has_flag("-V")) {
        print_version();
        return 0;
    }

    if (args.positional.empty()) {
        print_usage();
        return 0;
    }

    const std::string& command = args.positional[0];

    if (command == "json") {
        if (args.positional.size() != 2 || !check_flags(args, {"--pretty"})) {
            std::cerr << "Usage: knit json <file> [--pretty]\n";
            return 1;
        }
        return run_json(args.positional[1], args.has_flag("--pretty"), std::cout);
    }

    if (command == "nginx") {
        if (args.positional.size() != 2 || !check_flags(args, {"--fail-fast"})) {
            std::cerr << "Usage: knit nginx <file> [--fail-fast]\n";
            return 1;
        }
        return run_nginx(args.positional[1], args.has_flag("--fail-fast"), std::cout);
    }

    std::cerr << "error: unknown command '" << command << "'\n";
    std::cerr << "Run 'knit --help' for usage.\n";
    return 1;
}

} // namespace knit::cli
