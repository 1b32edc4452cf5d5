//! # Knit Logging
//!
//! Module-tagged diagnostics for the parsers and the CLI. Records go to
//! stderr and, optionally, a log file, one text line each:
//!
//! ```text
//! 14:02:11.348 WARN  [nginx] line 17: line 1, column 9: expected '.' [in ...]
//! ```
//!
//! ## Usage
//!
//! ```cpp
//! KNIT_LOG_INFO("cli", "parsed " << count << " records from " << path);
//! KNIT_LOG_DEBUG("nginx", err.to_string());
//! ```
//!
//! The message argument is a stream expression. It is evaluated only when the
//! record passes the module's threshold.
//!
//! ## Thresholds
//!
//! A `LogFilter` holds one fallback level plus per-module overrides, written
//! as `"nginx=trace,json=debug,*=warn"`. `*` sets the fallback and a bare module
//! name means `trace`.

#ifndef KNIT_LOG_HPP
#define KNIT_LOG_HPP

#include <atomic>
#include <functional>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace knit::log {

// ============================================================================
// Levels
// ============================================================================

/// Severity, lowest first. `Off` is only a threshold, never a record level.
enum class LogLevel : int { Trace, Debug, Info, Warn, Error, Fatal, Off };

/// Upper-case name, e.g. "TRACE".
const char* level_name(LogLevel level);

/// Case-insensitive level name, or `std::nullopt` for anything else.
std::optional<LogLevel> parse_level(std::string_view name);

// ============================================================================
// Records and Sinks
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    const char* file;
    int line;
};

/// Renders `HH:MM:SS.mmm LEVEL [module] message` without a newline. With
/// `colors` the level name is wrapped in an ANSI color.
std::string format_line(const LogRecord& record, bool colors = false);

/// True when stderr is a terminal and TERM is set to something other than
/// "dumb".
bool stderr_has_colors();

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes `format_line` output to a stream, either borrowed (stderr, a test
/// buffer) or a file the sink opens and owns. Error and Fatal records are
/// flushed immediately.
class StreamSink : public LogSink {
public:
    /// `out` must outlive the sink.
    explicit StreamSink(std::ostream& out, bool colors = false);

    /// Opens `path` for appending, or truncates it when `append` is false.
    /// Check `is_open()`; a sink that failed to open drops every record.
    static std::unique_ptr<StreamSink> open_file(const std::string& path, bool append = true);

    bool is_open() const;

    void write(const LogRecord& record) override;
    void flush() override;

private:
    explicit StreamSink(std::unique_ptr<std::ofstream> file);

    std::unique_ptr<std::ofstream> file_;
    std::ostream* out_;
    bool colors_ = false;
};

// ============================================================================
// Filter
// ============================================================================

struct LogFilter {
    LogLevel fallback = LogLevel::Info;
    std::map<std::string, LogLevel, std::less<>> modules;

    /// Builds a filter from a spec. Entries whose level does not parse are
    /// skipped; an empty spec yields just `fallback`.
    static LogFilter parse(std::string_view spec, LogLevel fallback);

    /// Lowest level `module` accepts.
    LogLevel threshold(std::string_view module) const;

    /// Lowest level any module accepts.
    LogLevel min_level() const;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    std::string filter_spec;
    std::string log_file;
    bool console = true;
    bool colors = true;
};

/// Process-wide logger. It has no sinks until `init()` or `add_sink()`, so the
/// library logs unconditionally and stays silent unless a host sets it up.
class Logger {
public:
    static Logger& instance();

    /// Replaces sinks and thresholds. A log file that cannot be opened is
    /// reported on stderr and skipped.
    static void init(const LogConfig& config);

    bool enabled(LogLevel level, std::string_view module) const;

    void write(LogLevel level, std::string_view module, std::string message, const char* file,
               int line);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();
    void flush();

    /// Fallback threshold; module overrides are kept.
    void set_level(LogLevel level);
    LogLevel level() const;

    /// Replaces module overrides; a `*=` entry also replaces the fallback.
    void set_filter(std::string_view spec);

private:
    Logger() = default;

    void apply(LogFilter filter);

    LogFilter filter_;
    std::atomic<LogLevel> floor_{LogLevel::Info};
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Command Line
// ============================================================================

/// Builds a LogConfig from argv: `--log-level=`, `--log-filter=`,
/// `--log-file=`, `-q`/`--quiet`, `-v`/`-vv`/`-vvv` and `--verbose`. With no
/// level or filter on the command line, `KNIT_LOG` is read instead. Default
/// level is Warn.
LogConfig parse_log_options(int argc, char* argv[]);

/// True for any argument parse_log_options consumes.
bool is_log_option(std::string_view arg);

// ============================================================================
// Macros
// ============================================================================

// Records below this level are compiled out (0=Trace ... 6=Off).
#ifndef KNIT_MIN_LOG_LEVEL
#define KNIT_MIN_LOG_LEVEL 0
#endif

#define KNIT_LOG_IMPL(level, module_str, msg)                                                      \
    do {                                                                                           \
        if (static_cast<int>(level) >= KNIT_MIN_LOG_LEVEL) {                                       \
            auto& knit_logger_ = ::knit::log::Logger::instance();                                  \
            if (knit_logger_.enabled(level, module_str)) {                                         \
                std::ostringstream knit_msg_;                                                      \
                knit_msg_ << msg;                                                                  \
                knit_logger_.write(level, module_str, knit_msg_.str(), __FILE__, __LINE__);        \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define KNIT_LOG_TRACE(module, msg) KNIT_LOG_IMPL(::knit::log::LogLevel::Trace, module, msg)
#define KNIT_LOG_DEBUG(module, msg) KNIT_LOG_IMPL(::knit::log::LogLevel::Debug, module, msg)
#define KNIT_LOG_INFO(module, msg) KNIT_LOG_IMPL(::knit::log::LogLevel::Info, module, msg)
#define KNIT_LOG_WARN(module, msg) KNIT_LOG_IMPL(::knit::log::LogLevel::Warn, module, msg)
#define KNIT_LOG_ERROR(module, msg) KNIT_LOG_IMPL(::knit::log::LogLevel::Error, module, msg)
#define KNIT_LOG_FATAL(module, msg) KNIT_LOG_IMPL(::knit::log::LogLevel::Fatal, module, msg)

} // namespace knit::log

#endif // KNIT_LOG_HPP
