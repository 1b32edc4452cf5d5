//! # Logger Implementation
//!
//! Level names, line formatting, the stream sink, module filters and the
//! Logger singleton.

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <iterator>

#include <unistd.h>

namespace knit::log {

// ============================================================================
// Levels
// ============================================================================

namespace {

// Indexed by LogLevel
const char* const LEVEL_NAMES[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL", "OFF"};
const char* const LEVEL_COLORS[] = {"\033[90m", "\033[36m", "\033[32m", "\033[33m",
                                    "\033[31m", "\033[1;31m", ""};

bool same_ignoring_case(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::toupper(static_cast<unsigned char>(x)) ==
                      std::toupper(static_cast<unsigned char>(y));
           });
}

} // namespace

const char* level_name(LogLevel level) {
    auto index = static_cast<size_t>(level);
    return index < std::size(LEVEL_NAMES) ? LEVEL_NAMES[index] : "???";
}

std::optional<LogLevel> parse_level(std::string_view name) {
    for (size_t i = 0; i < std::size(LEVEL_NAMES); ++i) {
        if (same_ignoring_case(name, LEVEL_NAMES[i])) {
            return static_cast<LogLevel>(i);
        }
    }
    return std::nullopt;
}

// ============================================================================
// Formatting
// ============================================================================

namespace {

/// Local wall-clock time as "HH:MM:SS.mmm".
std::string clock_time() {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
        1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis;
    return oss.str();
}

} // namespace

std::string format_line(const LogRecord& record, bool colors) {
    std::ostringstream oss;
    oss << clock_time() << ' ';
    if (colors) {
        oss << LEVEL_COLORS[static_cast<size_t>(record.level)];
    }
    oss << std::left << std::setw(5) << level_name(record.level);
    if (colors) {
        oss << "\033[0m";
    }
    oss << " [" << record.module << "] " << record.message;
    return oss.str();
}

bool stderr_has_colors() {
    if (!isatty(fileno(stderr))) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
}

// ============================================================================
// StreamSink
// ============================================================================

StreamSink::StreamSink(std::ostream& out, bool colors) : out_(&out), colors_(colors) {}

StreamSink::StreamSink(std::unique_ptr<std::ofstream> file)
    : file_(std::move(file)), out_(file_.get()) {}

std::unique_ptr<StreamSink> StreamSink::open_file(const std::string& path, bool append) {
    auto mode = append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc);
    return std::unique_ptr<StreamSink>(
        new StreamSink(std::make_unique<std::ofstream>(path, mode)));
}

bool StreamSink::is_open() const {
    return !file_ || file_->is_open();
}

void StreamSink::write(const LogRecord& record) {
    if (!is_open()) {
        return;
    }
    *out_ << format_line(record, colors_) << '\n';
    if (record.level >= LogLevel::Error) {
        out_->flush();
    }
}

void StreamSink::flush() {
    if (is_open()) {
        out_->flush();
    }
}

// ============================================================================
// LogFilter
// ============================================================================

LogFilter LogFilter::parse(std::string_view spec, LogLevel fallback) {
    LogFilter filter;
    filter.fallback = fallback;

    while (!spec.empty()) {
        auto comma = spec.find(',');
        auto entry = spec.substr(0, comma);
        spec = comma == std::string_view::npos ? std::string_view() : spec.substr(comma + 1);

        if (entry.empty()) {
            continue;
        }

        auto eq = entry.find('=');
        if (eq == std::string_view::npos) {
            filter.modules.insert_or_assign(std::string(entry), LogLevel::Trace);
            continue;
        }

        auto level = parse_level(entry.substr(eq + 1));
        if (!level) {
            continue;
        }
        auto module = entry.substr(0, eq);
        if (module == "*") {
            filter.fallback = *level;
        } else {
            filter.modules.insert_or_assign(std::string(module), *level);
        }
    }
    return filter;
}

LogLevel LogFilter::threshold(std::string_view module) const {
    auto it = modules.find(module);
    return it != modules.end() ? it->second : fallback;
}

LogLevel LogFilter::min_level() const {
    LogLevel lowest = fallback;
    for (const auto& [_, level] : modules) {
        lowest = std::min(lowest, level);
    }
    return lowest;
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    std::vector<std::unique_ptr<LogSink>> sinks;
    if (config.console) {
        sinks.push_back(
            std::make_unique<StreamSink>(std::cerr, config.colors && stderr_has_colors()));
    }
    if (!config.log_file.empty()) {
        auto file = StreamSink::open_file(config.log_file);
        if (file->is_open()) {
            sinks.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }

    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.sinks_ = std::move(sinks);
    logger.apply(LogFilter::parse(config.filter_spec, config.level));
}

bool Logger::enabled(LogLevel level, std::string_view module) const {
    if (level < floor_.load(std::memory_order_relaxed)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= filter_.threshold(module);
}

void Logger::write(LogLevel level, std::string_view module, std::string message,
                   const char* file, int line) {
    LogRecord record{level, module, std::move(message), file, line};

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    LogFilter filter = filter_;
    filter.fallback = level;
    apply(std::move(filter));
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.fallback;
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    apply(LogFilter::parse(spec, filter_.fallback));
}

// Callers hold mutex_.
void Logger::apply(LogFilter filter) {
    filter_ = std::move(filter);
    floor_.store(filter_.min_level(), std::memory_order_relaxed);
}

} // namespace knit::log
