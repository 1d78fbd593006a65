//! # simdbuild Logging
//!
//! Structured, module-tagged logging shared by every build component:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//! - Console, file, null and in-memory sinks
//! - Thread-safe dispatch (worker threads compile in parallel)
//! - Compile-time level elision via SIMDBUILD_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! SIMDBUILD_LOG_INFO("invoke", "Compiling " << source << " for " << targets);
//! SIMDBUILD_LOG_WARN("bindings", "Skipping unsupported declaration " << name);
//! ```
//!
//! ## Module Tags
//!
//! | Tag        | Component                         |
//! |------------|-----------------------------------|
//! | `config`   | BuildConfig validation            |
//! | `deps`     | Dependency tracker                |
//! | `invoke`   | Compiler invoker and worker pool  |
//! | `process`  | Child process runner              |
//! | `archive`  | Object linker / archiver          |
//! | `bindings` | Binding generator bridge          |
//! | `locate`   | Runtime artifact locator          |
//! | `rt`       | Task runtime and instrumentation  |

#ifndef SIMDBUILD_LOG_HPP
#define SIMDBUILD_LOG_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace simdbuild::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6 ///< Disables all logging
};

/// Returns the short string name for a log level (e.g., "TRACE", "DEBUG").
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

/// Parses a log level name (lower or upper case).
/// Returns LogLevel::Info if the string is not recognized.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;
    std::string_view module; ///< Module tag (e.g., "invoke", "archive")
    std::string message;
    const char* file; ///< Source file (__FILE__)
    int line;         ///< Source line (__LINE__)
    int64_t timestamp_ms;
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

private:
    bool colors_enabled_;

    const char* level_color(LogLevel level) const;
};

/// File sink, auto-flushes on Error and Fatal messages.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

private:
    std::ofstream file_;
};

/// Null sink that discards all messages.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// A message retained by MemorySink.
struct CapturedRecord {
    LogLevel level;
    std::string module;
    std::string message;
};

/// Sink that keeps every record in memory.
///
/// The records live in a shared buffer so a test can keep a handle after
/// handing the sink itself to the Logger.
class MemorySink : public LogSink {
public:
    using Buffer = std::vector<CapturedRecord>;

    MemorySink();

    void write(const LogRecord& record) override;
    void flush() override {}

    /// Snapshot of everything captured so far.
    Buffer records() const;

    /// Number of captured records at `level` from `module` (empty = any module).
    size_t count(LogLevel level, std::string_view module = {}) const;

    /// Returns true if any captured message contains `needle`.
    bool contains(std::string_view needle) const;

    /// Returns a second sink object feeding the same buffer.
    std::unique_ptr<MemorySink> share() const;

private:
    struct Shared {
        std::mutex mutex;
        Buffer records;
    };
    std::shared_ptr<Shared> shared_;

    explicit MemorySink(std::shared_ptr<Shared> shared) : shared_(std::move(shared)) {}
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses filter strings like "invoke=trace,deps=debug,*=warn" and
/// answers `should_log(level, module)`.
class LogFilter {
public:
    LogFilter() = default;

    /// Format: "module1=level,module2=level,*=default_level".
    /// Bare module names enable Trace for that module.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Minimum configured level across all modules and the default.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn;
    std::string filter_spec; ///< Module filter string
    std::string log_file;    ///< Path to log file (empty = no file)
    bool console = true;
    bool colors = true;
};

/// Builds a LogConfig from the value of the SIMDBUILD_LOG variable.
///
/// A plain level name ("debug") sets the global level; anything containing
/// '=' or ',' is treated as a filter spec.
LogConfig config_from_spec(std::string_view env_value);

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Starts with a console sink at Warn level so warnings from the build are
/// visible even when nobody called `init()`.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by macros before constructing the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink (including the default console sink).
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_.load(std::memory_order_relaxed);
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    std::atomic<LogLevel> level_{LogLevel::Warn};
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Timestamp Helpers
// ============================================================================

/// Returns current time formatted as "HH:MM:SS.mmm".
std::string get_timestamp();

/// Returns milliseconds since epoch (for LogRecord timestamps).
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef SIMDBUILD_MIN_LOG_LEVEL
#define SIMDBUILD_MIN_LOG_LEVEL 0
#endif

/// Internal macro, do not use directly.
#define SIMDBUILD_LOG_IMPL(level, module_str, msg)                                                 \
    do {                                                                                           \
        if (static_cast<int>(level) >= SIMDBUILD_MIN_LOG_LEVEL) {                                  \
            auto& logger_ = ::simdbuild::log::Logger::instance();                                  \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Usage: SIMDBUILD_LOG_TRACE("module", "message " << value);
#define SIMDBUILD_LOG_TRACE(module, msg) SIMDBUILD_LOG_IMPL(::simdbuild::log::LogLevel::Trace, module, msg)
#define SIMDBUILD_LOG_DEBUG(module, msg) SIMDBUILD_LOG_IMPL(::simdbuild::log::LogLevel::Debug, module, msg)
#define SIMDBUILD_LOG_INFO(module, msg) SIMDBUILD_LOG_IMPL(::simdbuild::log::LogLevel::Info, module, msg)
#define SIMDBUILD_LOG_WARN(module, msg) SIMDBUILD_LOG_IMPL(::simdbuild::log::LogLevel::Warn, module, msg)
#define SIMDBUILD_LOG_ERROR(module, msg) SIMDBUILD_LOG_IMPL(::simdbuild::log::LogLevel::Error, module, msg)
#define SIMDBUILD_LOG_FATAL(module, msg) SIMDBUILD_LOG_IMPL(::simdbuild::log::LogLevel::Fatal, module, msg)

} // namespace simdbuild::log

#endif // SIMDBUILD_LOG_HPP
