//! # JSON Command
//!
//! `knit json <file> [--pretty]`: parses one JSON document and prints it back
//! in compact or indented form.

#pragma once

#include "common.hpp"
#include "parse/parse_error.hpp"

#include <iosfwd>
#include <string>
#include <string_view>

namespace knit::cli {

/// Parses `text` and renders it compact or indented.
Result<std::string, parse::ParseError> render_json(std::string_view text, bool pretty);

/// Runs the command on a file. Returns the process exit code.
int run_json(const std::string& path, bool pretty, std::ostream& out);

} // namespace knit::cli
