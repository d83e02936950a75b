//! # deepclone Logging
//!
//! A small structured logger shared by every deepclone module:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering ("plan", "cache", ...)
//! - Console, file and null sinks
//! - Thread-safe dispatch with mutex protection
//! - Compile-time level elision via DEEPCLONE_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! DEEPCLONE_LOG_DEBUG("plan", "Compiled clone plan for " << type.name);
//! DEEPCLONE_LOG_TRACE("cache", "Evicted " << type.name << " from limited tier");
//! ```
//!
//! The logger configures itself from the `DEEPCLONE_LOG` environment variable
//! the first time it is used. `Logger::init()` replaces that configuration.

#ifndef DEEPCLONE_LOG_HPP
#define DEEPCLONE_LOG_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace deepclone::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Potential issues
    Error = 4, ///< Recoverable errors
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name for a log level (e.g., "TRACE", "DEBUG").
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

/// Parses a log level name, ignoring case. Unknown names map to Info.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "plan", "cache")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< One JSON object per line
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Console sink that writes to stderr with optional ANSI colors.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// File sink. Flushes eagerly on Error and Fatal messages.
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

/// Sink that discards every record.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Renders a record as a single line (no trailing newline) in the given format.
std::string format_record(const LogRecord& record, LogFormat format);

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses specs like "plan=trace,cache=debug,*=warn". A bare module name
/// enables everything from that module.
class LogFilter {
public:
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level accepted by any module or by the default.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Warn;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
};

/// Builds a LogConfig from a `DEEPCLONE_LOG` style value: either a single level
/// name ("debug") or a module filter spec ("plan=debug,*=warn").
LogConfig parse_log_spec(std::string_view spec);

/// Reads `DEEPCLONE_LOG` and `DEEPCLONE_LOG_FILE` from the environment.
LogConfig config_from_env();

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
class Logger {
public:
    /// Replace the global logger configuration (sinks, level, filter).
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Remove every sink (messages are dropped until one is added).
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_.load(std::memory_order_relaxed);
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    void apply(const LogConfig& config);

    std::atomic<LogLevel> level_{LogLevel::Warn};
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Timestamp Helpers
// ============================================================================

/// Returns current local time formatted as "HH:MM:SS.mmm".
std::string get_timestamp();

/// Returns milliseconds since epoch.
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// Logging Macros
// ============================================================================

// Compile-time minimum log level gate.
// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef DEEPCLONE_MIN_LOG_LEVEL
#define DEEPCLONE_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific macros below.
#define DEEPCLONE_LOG_IMPL(level, module_str, msg)                                                 \
    do {                                                                                           \
        if (static_cast<int>(level) >= DEEPCLONE_MIN_LOG_LEVEL) {                                  \
            auto& logger_ = ::deepclone::log::Logger::instance();                                  \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define DEEPCLONE_LOG_TRACE(module, msg)                                                           \
    DEEPCLONE_LOG_IMPL(::deepclone::log::LogLevel::Trace, module, msg)
#define DEEPCLONE_LOG_DEBUG(module, msg)                                                           \
    DEEPCLONE_LOG_IMPL(::deepclone::log::LogLevel::Debug, module, msg)
#define DEEPCLONE_LOG_INFO(module, msg)                                                            \
    DEEPCLONE_LOG_IMPL(::deepclone::log::LogLevel::Info, module, msg)
#define DEEPCLONE_LOG_WARN(module, msg)                                                            \
    DEEPCLONE_LOG_IMPL(::deepclone::log::LogLevel::Warn, module, msg)
#define DEEPCLONE_LOG_ERROR(module, msg)                                                           \
    DEEPCLONE_LOG_IMPL(::deepclone::log::LogLevel::Error, module, msg)
#define DEEPCLONE_LOG_FATAL(module, msg)                                                           \
    DEEPCLONE_LOG_IMPL(::deepclone::log::LogLevel::Fatal, module, msg)

} // namespace deepclone::log

#endif // DEEPCLONE_LOG_HPP
