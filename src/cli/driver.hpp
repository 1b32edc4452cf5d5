//! # Driver Interface
//!
//! `knit_main()` dispatches to the subcommand named by the first positional
//! argument.

#pragma once

namespace knit::cli {

// Main driver entry point
int knit_main(int argc, char* argv[]);

} // namespace knit::cli
