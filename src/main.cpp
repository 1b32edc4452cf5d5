//! # knit Entry Point
//!
//! ```bash
//! knit json config.json --pretty      # Parse and pretty-print a JSON document
//! knit nginx access.log               # Convert log lines to JSON records
//! knit nginx access.log --fail-fast   # Stop at the first malformed line
//! ```
//!
//! All work happens in the CLI driver (`cli/driver.hpp`).

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return knit::cli::knit_main(argc, argv);
}
