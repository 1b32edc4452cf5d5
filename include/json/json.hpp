//! # knit JSON
//!
//! Public header for the JSON grammar and its value model.
//!
//! ```cpp
//! #include "json/json.hpp"
//! using namespace knit::json;
//!
//! auto result = parse_json(R"({"name": "Alice", "scores": [95, 87.5]})");
//! if (is_ok(result)) {
//!     std::cout << unwrap(result).to_string_pretty(2) << std::endl;
//! }
//! ```
//!
//! | Header             | Description                                   |
//! |--------------------|-----------------------------------------------|
//! | `json_value.hpp`   | `JsonValue`, `JsonNumber`, serialization      |
//! | `json_parser.hpp`  | Grammar rules and `parse_json`                |

#pragma once

#include "json/json_parser.hpp"
#include "json/json_value.hpp"
