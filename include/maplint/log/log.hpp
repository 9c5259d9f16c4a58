//! # maplint Logging
//!
//! Module-tagged logging shared by the analyzer, the fix engine and the CLI.
//!
//! - Six severities plus `Off`
//! - Per-module filtering (`classify=trace,*=warn`)
//! - Console, file, null and fan-out sinks
//! - Compile-time elision via `MAPLINT_MIN_LOG_LEVEL`
//!
//! ## Usage
//!
//! ```cpp
//! MAPLINT_LOG_DEBUG("registry", "edge " << from << " -> " << to);
//! MAPLINT_LOG_WARN("config", "unknown key '" << key << "'");
//! ```

#ifndef MAPLINT_LOG_LOG_HPP
#define MAPLINT_LOG_LOG_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace maplint::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Severity levels, ascending.
enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

/// Upper-case name of a level ("TRACE", "WARN", ...).
inline const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

/// Two-letter level tag used by the `{level_short}` format token.
inline const char* level_short_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TR";
    case LogLevel::Debug:
        return "DB";
    case LogLevel::Info:
        return "IN";
    case LogLevel::Warn:
        return "WN";
    case LogLevel::Error:
        return "ER";
    case LogLevel::Fatal:
        return "FA";
    case LogLevel::Off:
        return "--";
    }
    return "??";
}

/// Parses a level name in either case. Unknown names map to Info.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Records and Formats
// ============================================================================

/// One emitted log message.
struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms;
};

enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One object per line
};

/// Renders a record as a single-line JSON object (no trailing newline).
std::string record_to_json(const LogRecord& record);

/// Renders a record as a text line (no trailing newline).
std::string record_to_text(const LogRecord& record);

// ============================================================================
// Sinks
// ============================================================================

/// Destination for log records.
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, colored when stderr is a color terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_color_enabled(bool enabled) {
        colors_enabled_ = enabled;
    }
    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;

    const char* level_color(LogLevel level) const;
};

/// Appends to a file. Flushes after Error and Fatal records.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }
    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Forwards each record to every child sink.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    size_t size() const {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

// ============================================================================
// Filter
// ============================================================================

/// Per-module level thresholds.
///
/// Spec format: `module=level,module2=level,*=default`. A bare module name
/// enables everything for that module.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }
    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest threshold across the default and every module override.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Formatter
// ============================================================================

/// Template-driven record formatting.
///
/// Tokens: {time}, {time_ms}, {level}, {level_short}, {module}, {message},
/// {file}, {line}. Unknown tokens are copied through unchanged.
class LogFormatter {
public:
    explicit LogFormatter(
        std::string_view format_template = "{time} {level_short} [{module}] {message}");

    std::string format(const LogRecord& record) const;

    void set_template(std::string_view format_template);
    const std::string& get_template() const {
        return template_;
    }

private:
    std::string template_;
};

// ============================================================================
// Logger
// ============================================================================

/// Logger setup, usually produced by `parse_log_options`.
struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec;
    std::string log_file;
    bool console = true;
    bool colors = true;
};

/// Process-wide logger. Sink writes are serialized by a mutex.
class Logger {
public:
    static void init(const LogConfig& config);
    static Logger& instance();

    /// Fast check used by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink. Used by tests that install their own capture sink.
    void clear_sinks();

    void set_level(LogLevel level);
    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);
    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Time Helpers
// ============================================================================

/// Local wall-clock time as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now_c);
#else
    localtime_r(&now_c, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Reads --log-level=, --log-filter=, --log-file=, --log-format=, -v/-vv/-vvv
/// and -q from argv, falling back to the MAPLINT_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

/// True if `arg` is consumed by `parse_log_options`.
bool is_log_option(std::string_view arg);

// ============================================================================
// Macros
// ============================================================================

// 0=Trace ... 6=Off. Calls below this level compile to nothing.
#ifndef MAPLINT_MIN_LOG_LEVEL
#define MAPLINT_MIN_LOG_LEVEL 0
#endif

#define MAPLINT_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= MAPLINT_MIN_LOG_LEVEL) {                                    \
            auto& logger_ = ::maplint::log::Logger::instance();                                    \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define MAPLINT_LOG_TRACE(module, msg) MAPLINT_LOG_IMPL(::maplint::log::LogLevel::Trace, module, msg)
#define MAPLINT_LOG_DEBUG(module, msg) MAPLINT_LOG_IMPL(::maplint::log::LogLevel::Debug, module, msg)
#define MAPLINT_LOG_INFO(module, msg) MAPLINT_LOG_IMPL(::maplint::log::LogLevel::Info, module, msg)
#define MAPLINT_LOG_WARN(module, msg) MAPLINT_LOG_IMPL(::maplint::log::LogLevel::Warn, module, msg)
#define MAPLINT_LOG_ERROR(module, msg) MAPLINT_LOG_IMPL(::maplint::log::LogLevel::Error, module, msg)
#define MAPLINT_LOG_FATAL(module, msg) MAPLINT_LOG_IMPL(::maplint::log::LogLevel::Fatal, module, msg)

} // namespace maplint::log

#endif // MAPLINT_LOG_LOG_HPP
