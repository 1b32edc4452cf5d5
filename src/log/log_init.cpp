//! # Logging Options
//!
//! Reads the logging flags out of argv and falls back to the KNIT_LOG
//! environment variable, which holds either a level name or a filter spec.
//! The environment is read only when argv names no level and no filter.

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace knit::log {

namespace {

constexpr std::string_view LEVEL_PREFIX = "--log-level=";
constexpr std::string_view FILTER_PREFIX = "--log-filter=";
constexpr std::string_view FILE_PREFIX = "--log-file=";

/// 1 for "-v", 2 for "-vv" and so on; 0 for anything else.
int verbosity(std::string_view arg) {
    if (arg.size() < 2 || arg[0] != '-' || arg.find_first_not_of('v', 1) != std::string_view::npos) {
        return 0;
    }
    return static_cast<int>(arg.size() - 1);
}

LogLevel level_for_verbosity(int count) {
    switch (count) {
    case 1:
        return LogLevel::Info;
    case 2:
        return LogLevel::Debug;
    default:
        return LogLevel::Trace;
    }
}

} // namespace

bool is_log_option(std::string_view arg) {
    return arg.starts_with(LEVEL_PREFIX) || arg.starts_with(FILTER_PREFIX) ||
           arg.starts_with(FILE_PREFIX) || arg == "-q" || arg == "--quiet" ||
           arg == "--verbose" || verbosity(arg) > 0;
}

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;

    std::optional<LogLevel> explicit_level;
    bool quiet = false;
    int verbose = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg.starts_with(LEVEL_PREFIX)) {
            // An unknown name leaves the level to the other options
            if (auto level = parse_level(arg.substr(LEVEL_PREFIX.size()))) {
                explicit_level = level;
            }
        } else if (arg.starts_with(FILTER_PREFIX)) {
            config.filter_spec = arg.substr(FILTER_PREFIX.size());
        } else if (arg.starts_with(FILE_PREFIX)) {
            config.log_file = arg.substr(FILE_PREFIX.size());
        } else if (arg == "-q" || arg == "--quiet") {
            quiet = true;
        } else if (arg == "--verbose") {
            verbose = std::max(verbose, 1);
        } else {
            verbose = std::max(verbose, verbosity(arg));
        }
    }

    // --log-level beats -q, which beats -v
    if (explicit_level) {
        config.level = *explicit_level;
    } else if (quiet) {
        config.level = LogLevel::Error;
    } else if (verbose > 0) {
        config.level = level_for_verbosity(verbose);
    } else if (config.filter_spec.empty()) {
        const char* env = std::getenv("KNIT_LOG");
        std::string_view value = env ? env : "";
        if (auto level = parse_level(value)) {
            config.level = *level;
        } else {
            config.filter_spec = value;
        }
    }

    return config;
}

} // namespace knit::log
