//! # Cursor Implementation
//!
//! Line and column are computed on demand by scanning the consumed prefix, so
//! they cost O(offset). Parsers never call them; `ParseError::locate` does,
//! once per failed top-level parse. `excerpt` looks at no more than `max_len`
//! bytes.

#include "parse/cursor.hpp"

#include <algorithm>

namespace knit::parse {

auto Cursor::advance(size_t count) const -> Cursor {
    return Cursor(input_, std::min(offset_ + count, input_.size()));
}

auto Cursor::line() const -> size_t {
    auto consumed = input_.substr(0, offset_);
    return 1 + static_cast<size_t>(std::count(consumed.begin(), consumed.end(), '\n'));
}

auto Cursor::column() const -> size_t {
    auto consumed = input_.substr(0, offset_);
    auto last_newline = consumed.rfind('\n');
    if (last_newline == std::string_view::npos) {
        return offset_ + 1;
    }
    return offset_ - last_newline;
}

auto Cursor::excerpt(size_t max_len) const -> std::string {
    auto rest = remaining();
    bool truncated = rest.size() > max_len;
    rest = rest.substr(0, max_len);
    auto newline = rest.find('\n');
    if (newline != std::string_view::npos) {
        rest = rest.substr(0, newline);
        truncated = true;
    }
    std::string out(rest);
    if (truncated) {
        out += "...";
    }
    return out;
}

} // namespace knit::parse
