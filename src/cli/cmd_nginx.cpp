#include "cmd_nginx.hpp"

#include "log/log.hpp"
#include "nginx/nginx_parser.hpp"

#include <fstream>
#include <iostream>

namespace knit::cli {

NginxRunStats process_log_stream(std::istream& in, std::ostream& out, bool fail_fast) {
    NginxRunStats stats;
    std::string line;
    size_t line_number = 0;

    while (std::getline(in, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            ++stats.skipped;
            continue;
        }

        auto result = nginx::parse_nginx_log(line);
        if (is_err(result)) {
            ++stats.failed;
            KNIT_LOG_WARN("cli", "line " << line_number << ": " << unwrap_err(result).to_string());
            if (fail_fast) {
                break;
            }
            continue;
        }

        ++stats.parsed;
        out << nginx::to_json(unwrap(result)).to_string() << "\n";
    }

    return stats;
}

int run_nginx(const std::string& path, bool fail_fast, std::ostream& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::cerr << "error: cannot open file: " << path << "\n";
        return 1;
    }

    auto stats = process_log_stream(file, out, fail_fast);
    if (file.bad()) {
        std::cerr << "error: cannot read file: " << path << "\n";
        return 1;
    }

    KNIT_LOG_INFO("cli", path << ": " << stats.parsed << " records parsed, " << stats.failed
                              << " lines failed, " << stats.skipped << " empty lines");
    return stats.failed > 0 ? 1 : 0;
}

} // namespace knit::cli
