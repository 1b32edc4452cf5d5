//! # knit NGINX
//!
//! Public header for the combined-log-line grammar and its record type.
//!
//! ```cpp
//! #include "nginx/nginx.hpp"
//! using namespace knit::nginx;
//!
//! auto result = parse_nginx_log(line);
//! if (is_ok(result)) {
//!     std::cout << to_json(unwrap(result)) << std::endl;
//! }
//! ```

#pragma once

#include "nginx/nginx_log.hpp"
#include "nginx/nginx_parser.hpp"
