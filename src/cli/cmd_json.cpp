#include "cmd_json.hpp"

#include "json/json_parser.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace knit::cli {

Result<std::string, parse::ParseError> render_json(std::string_view text, bool pretty) {
    auto result = json::parse_json(text);
    if (is_err(result)) {
        return std::move(unwrap_err(result));
    }
    const auto& value = unwrap(result);
    return pretty ? value.to_string_pretty() : value.to_string();
}

int run_json(const std::string& path, bool pretty, std::ostream& out) {
    std::string text;
    try {
        text = read_file(path);
    } catch (const std::runtime_error& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    KNIT_LOG_INFO("cli", "parsing JSON document " << path << " (" << text.size() << " bytes)");

    auto rendered = render_json(text, pretty);
    if (is_err(rendered)) {
        std::cerr << "error: " << path << ": " << unwrap_err(rendered).to_string() << "\n";
        return 1;
    }

    out << unwrap(rendered) << "\n";
    return 0;
}

} // namespace knit::cli
