#include "utils.hpp"

#include "common.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace knit::cli {

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("cannot read file: " + path);
    }
    return buffer.str();
}

void print_usage() {
    std::cout << "knit " << VERSION << "\n\n";
    std::cout << "Usage: knit <command> <file> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  json <file>      Parse a JSON document and print it back\n";
    std::cout << "  nginx <file>     Parse NGINX combined log lines into JSON records\n";
    std::cout << "\nCommand options:\n";
    std::cout << "  --pretty         (json) Indent the output\n";
    std::cout << "  --fail-fast      (nginx) Stop at the first malformed line\n";
    std::cout << "\nLogging options:\n";
    std::cout << "  --log-level=<l>  trace, debug, info, warn, error, fatal, off\n";
    std::cout << "  --log-filter=<s> Per-module levels, e.g. nginx=debug,*=warn\n";
    std::cout << "  --log-file=<p>   Also write log records to a file\n";
    std::cout << "  -v, -vv, -vvv    Info, debug, trace\n";
    std::cout << "  -q, --quiet      Errors only\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h       Show this help\n";
    std::cout << "  --version, -V    Show version\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  KNIT_LOG         Level name or filter spec when no logging option is given\n";
}

void print_version() {
    std::cout << "knit " << VERSION << "\n";
}

} // namespace knit::cli
