//! # NGINX Command
//!
//! `knit nginx <file> [--fail-fast]`: parses one combined-log record per line
//! and prints each record as a single-line JSON object.
//!
//! Empty lines are ignored and a trailing `\r` is stripped. A malformed line
//! is logged at Warn with its line number and skipped; with `--fail-fast` the
//! run stops at the first one instead.

#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>

namespace knit::cli {

/// Counters for one run over a log stream.
struct NginxRunStats {
    size_t parsed = 0;  ///< Records printed
    size_t failed = 0;  ///< Lines that did not parse
    size_t skipped = 0; ///< Empty lines
};

/// Parses every line of `in`, writing one JSON object per record to `out`.
NginxRunStats process_log_stream(std::istream& in, std::ostream& out, bool fail_fast);

/// Runs the command on a file. Returns 1 if the file cannot be read or any
/// line failed, 0 otherwise.
int run_nginx(const std::string& path, bool fail_fast, std::ostream& out);

} // namespace knit::cli
