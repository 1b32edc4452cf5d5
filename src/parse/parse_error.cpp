#include "parse/parse_error.hpp"

namespace knit::parse {

auto kind_name(ParseErrorKind kind) -> const char* {
    switch (kind) {
    case ParseErrorKind::Token:
        return "token";
    case ParseErrorKind::Conversion:
        return "conversion";
    case ParseErrorKind::Format:
        return "format";
    }
    return "unknown";
}

auto ParseError::make(ParseErrorKind kind, const Cursor& at, std::string msg) -> ParseError {
    ParseError err;
    err.kind = kind;
    err.message = std::move(msg);
    err.offset = at.offset();
    err.near = at.excerpt();
    return err;
}

auto ParseError::locate(std::string_view input) -> ParseError& {
    auto at = Cursor(input).advance(offset);
    line = at.line();
    column = at.column();
    return *this;
}

auto ParseError::to_string() const -> std::string {
    std::string out;
    if (line == 0) {
        out = "offset " + std::to_string(offset) + ": " + message;
    } else {
        out = "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
              message;
    }

    if (near.empty()) {
        out += " (at end of input)";
    } else {
        out += " (near \"" + near + "\")";
    }

    if (!context.empty()) {
        out += " [in ";
        for (size_t i = context.size(); i > 0; --i) {
            out += context[i - 1];
            if (i > 1) {
                out += " > ";
            }
        }
        out += "]";
    }
    return out;
}

} // namespace knit::parse
