//! # Logger Implementation
//!
//! Sinks, filter, formatter and the Logger singleton.

#include "maplint/log/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#define MAPLINT_ISATTY(fd) _isatty(fd)
#define MAPLINT_FILENO(f) _fileno(f)
#else
#include <unistd.h>
#define MAPLINT_ISATTY(fd) isatty(fd)
#define MAPLINT_FILENO(f) fileno(f)
#endif

namespace maplint::log {

LogLevel parse_level(std::string_view s) {
    std::string lower;
    lower.reserve(s.size());
    for (char c : s) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warn;
    if (lower == "error")
        return LogLevel::Error;
    if (lower == "fatal")
        return LogLevel::Fatal;
    if (lower == "off")
        return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Record Rendering
// ============================================================================

static void append_json_escaped(std::ostringstream& oss, std::string_view text) {
    for (char c : text) {
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            oss << c;
        }
    }
}

std::string record_to_json(const LogRecord& record) {
    std::ostringstream oss;
    oss << "{\"ts\":" << record.timestamp_ms << ",\"level\":\"" << level_name(record.level)
        << "\",\"module\":\"";
    append_json_escaped(oss, record.module);
    oss << "\",\"msg\":\"";
    append_json_escaped(oss, record.message);
    oss << "\"}";
    return oss.str();
}

std::string record_to_text(const LogRecord& record) {
    std::ostringstream oss;
    oss << get_timestamp() << " " << std::left << std::setw(5) << level_name(record.level) << " ["
        << record.module << "] " << record.message;
    return oss.str();
}

// ============================================================================
// ConsoleSink
// ============================================================================

static bool stderr_supports_colors() {
    if (!MAPLINT_ISATTY(MAPLINT_FILENO(stderr)))
        return false;
    const char* term = std::getenv("TERM");
    if (!term)
        return false;
    return std::string_view(term) != "dumb";
}

ConsoleSink::ConsoleSink(bool use_colors)
    : colors_enabled_(use_colors && stderr_supports_colors()) {}

const char* ConsoleSink::level_color(LogLevel level) const {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m";
    case LogLevel::Debug:
        return "\033[36m";
    case LogLevel::Info:
        return "\033[32m";
    case LogLevel::Warn:
        return "\033[33m";
    case LogLevel::Error:
        return "\033[31m";
    case LogLevel::Fatal:
        return "\033[1;31m";
    case LogLevel::Off:
        return "";
    }
    return "";
}

void ConsoleSink::write(const LogRecord& record) {
    if (format_ == LogFormat::JSON) {
        std::cerr << record_to_json(record) << "\n";
        return;
    }

    std::ostringstream oss;
    oss << get_timestamp() << " ";
    if (colors_enabled_) {
        oss << level_color(record.level);
    }
    oss << std::left << std::setw(5) << level_name(record.level);
    if (colors_enabled_) {
        oss << "\033[0m";
    }
    oss << " [" << record.module << "] " << record.message << "\n";
    std::cerr << oss.str();
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out) {}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;

    file_ << (format_ == LogFormat::JSON ? record_to_json(record) : record_to_text(record)) << "\n";

    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// MultiSink
// ============================================================================

void MultiSink::write(const LogRecord& record) {
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void MultiSink::flush() {
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

void MultiSink::add(std::unique_ptr<LogSink> sink) {
    sinks_.push_back(std::move(sink));
}

// ============================================================================
// LogFormatter
// ============================================================================

LogFormatter::LogFormatter(std::string_view format_template) : template_(format_template) {}

void LogFormatter::set_template(std::string_view format_template) {
    template_ = std::string(format_template);
}

std::string LogFormatter::format(const LogRecord& record) const {
    std::string out;
    out.reserve(template_.size() + record.message.size() + 32);

    size_t i = 0;
    while (i < template_.size()) {
        size_t close = template_[i] == '{' ? template_.find('}', i + 1) : std::string::npos;
        if (close == std::string::npos) {
            out += template_[i++];
            continue;
        }

        auto token = std::string_view(template_).substr(i + 1, close - i - 1);
        if (token == "time") {
            out += get_timestamp();
        } else if (token == "time_ms") {
            out += std::to_string(record.timestamp_ms);
        } else if (token == "level") {
            out += level_name(record.level);
        } else if (token == "level_short") {
            out += level_short_name(record.level);
        } else if (token == "module") {
            out += record.module;
        } else if (token == "message") {
            out += record.message;
        } else if (token == "file") {
            out += record.file ? record.file : "";
        } else if (token == "line") {
            out += std::to_string(record.line);
        } else {
            out += '{';
            out += token;
            out += '}';
        }
        i = close + 1;
    }

    return out;
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    size_t pos = 0;
    while (pos < spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }

        auto token = spec.substr(pos, comma - pos);
        size_t eq = token.find('=');
        if (eq != std::string_view::npos) {
            auto mod = token.substr(0, eq);
            auto lvl = parse_level(token.substr(eq + 1));
            if (mod == "*") {
                default_level_ = lvl;
            } else {
                module_levels_[std::string(mod)] = lvl;
            }
        } else if (!token.empty()) {
            module_levels_[std::string(token)] = LogLevel::Trace;
        }

        pos = comma + 1;
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto it = module_levels_.find(std::string(module));
    if (it != module_levels_.end()) {
        return level >= it->second;
    }
    return level >= default_level_;
}

LogLevel LogFilter::min_level() const {
    LogLevel min = default_level_;
    for (const auto& [_, level] : module_levels_) {
        min = std::min(min, level);
    }
    return min;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    filter_.set_default_level(level_);
    sinks_.push_back(std::make_unique<ConsoleSink>());
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.level_ = config.level;

    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
        // A spec without "*=" inherits the CLI level as its default.
        if (config.level < logger.filter_.default_level()) {
            logger.filter_.set_default_level(config.level);
        }
        logger.level_ = logger.filter_.min_level();
    } else {
        logger.filter_.set_default_level(config.level);
    }

    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        logger.sinks_.push_back(std::move(console));
    }

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        file->set_format(config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    if (level < level_)
        return false;
    return filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    log(LogRecord{level, module, message, file, line, epoch_ms()});
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    filter_.set_default_level(level);
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    level_ = std::min(level_, filter_.min_level());
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace maplint::log
