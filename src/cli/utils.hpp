//! # CLI Utilities Interface
//!
//! | Function          | Description                          |
//! |-------------------|--------------------------------------|
//! | `read_file()`     | Read an entire file into a string    |
//! | `print_usage()`   | Print CLI help text                  |
//! | `print_version()` | Print the knit version               |

#pragma once

#include <string>

namespace knit::cli {

// File I/O, throws std::runtime_error when the file cannot be read
std::string read_file(const std::string& path);

// Help text
void print_usage();
void print_version();

} // namespace knit::cli
