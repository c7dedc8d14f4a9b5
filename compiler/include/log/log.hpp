//! # Talk++ Logging
//!
//! A structured logging library for the Talk++ compiler with:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-stage filtering
//! - Console, file, null and in-memory sinks
//! - Thread-safe output with mutex protection
//! - Compile-time level elision via TALKPP_MIN_LOG_LEVEL
//!
//! The logger has no sinks until `Logger::init()` or `add_sink()` is called,
//! so embedding the compiler as a library produces no output by default.
//!
//! ## Usage
//!
//! ```cpp
//! TALKPP_LOG_INFO("build", "Compiling " << input << " -> " << output);
//! TALKPP_LOG_WARN("codegen", "Service '" << name << "' is not registered");
//! ```

#ifndef TALKPP_LOG_HPP
#define TALKPP_LOG_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace talkpp::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Severity levels, ordered from most to least verbose.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Potential issues
    Error = 4, ///< Recoverable errors
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the uppercase name of a level ("WARN").
[[nodiscard]] auto level_name(LogLevel level) -> const char*;

/// Parses a level name in lower or upper case. Unknown names map to Info.
[[nodiscard]] auto parse_level(std::string_view s) -> LogLevel;

// ============================================================================
// Log Record
// ============================================================================

/// A single log entry passed to every sink.
struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string module;
    std::string message;
    const char* file = nullptr;
    int line = 0;
    int64_t timestamp_ms = 0; ///< Milliseconds since epoch
};

/// Output format shared by the console and file sinks.
enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One JSON object per line
};

/// Renders a record as a text line without trailing newline.
[[nodiscard]] auto format_text(const LogRecord& record) -> std::string;

/// Renders a record as a JSON object without trailing newline.
[[nodiscard]] auto format_json(const LogRecord& record) -> std::string;

// ============================================================================
// Log Sinks
// ============================================================================

/// Destination for log records.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;

    virtual void flush() = 0;
};

/// Writes records to stderr, colored when stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true, LogFormat format = LogFormat::Text);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool colors_enabled_;
    LogFormat format_;
};

/// Appends records to a file. Flushes after Error and Fatal records.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, LogFormat format = LogFormat::Text);

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

private:
    std::ofstream file_;
    LogFormat format_;
};

/// Discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Keeps records in memory.
///
/// Used by tests and by embedders that want to inspect generator warnings.
/// The record list is shared, so a caller can keep a handle after moving the
/// sink into the logger.
class MemorySink : public LogSink {
public:
    MemorySink();

    void write(const LogRecord& record) override;
    void flush() override {}

    /// Returns a copy of everything written so far.
    [[nodiscard]] auto records() const -> std::vector<LogRecord>;

    /// Returns the shared storage backing this sink.
    [[nodiscard]] auto storage() const -> std::shared_ptr<std::vector<LogRecord>> {
        return records_;
    }

private:
    std::shared_ptr<std::vector<LogRecord>> records_;
    std::shared_ptr<std::mutex> mutex_;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Per-module level filter.
///
/// Spec syntax: `module=level,module=level,*=level`. A bare module name
/// enables everything from that module.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// Lowest level any module accepts.
    [[nodiscard]] auto min_level() const -> LogLevel;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

/// Settings consumed by `Logger::init()`.
struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Process-wide logger.
class Logger {
public:
    /// Replaces sinks, level and filter from a configuration.
    static void init(const LogConfig& config);

    static auto instance() -> Logger&;

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes all sinks and restores the default level. Used by tests.
    void reset();

    void set_level(LogLevel level);

    [[nodiscard]] auto level() const -> LogLevel;

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger() = default;

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Milliseconds since epoch.
[[nodiscard]] auto epoch_ms() -> int64_t;

// ============================================================================
// CLI Parsing
// ============================================================================

/// Builds a LogConfig from `--log-level=`, `--log-filter=`, `--log-file=`,
/// `--log-format=`, `-q`, `-v`/`-vv`/`-vvv`, falling back to `TALKPP_LOG`.
[[nodiscard]] auto parse_log_options(int argc, char* argv[]) -> LogConfig;

/// Returns true for arguments consumed by `parse_log_options()`.
[[nodiscard]] auto is_log_option(std::string_view arg) -> bool;

// ============================================================================
// Logging Macros
// ============================================================================

// Compile-time minimum log level gate.
// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef TALKPP_MIN_LOG_LEVEL
#define TALKPP_MIN_LOG_LEVEL 0
#endif

#define TALKPP_LOG_IMPL(level, module_str, msg)                                                    \
    do {                                                                                           \
        if (static_cast<int>(level) >= TALKPP_MIN_LOG_LEVEL) {                                     \
            auto& logger_ = ::talkpp::log::Logger::instance();                                     \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define TALKPP_LOG_TRACE(module, msg) TALKPP_LOG_IMPL(::talkpp::log::LogLevel::Trace, module, msg)

#define TALKPP_LOG_DEBUG(module, msg) TALKPP_LOG_IMPL(::talkpp::log::LogLevel::Debug, module, msg)

#define TALKPP_LOG_INFO(module, msg) TALKPP_LOG_IMPL(::talkpp::log::LogLevel::Info, module, msg)

#define TALKPP_LOG_WARN(module, msg) TALKPP_LOG_IMPL(::talkpp::log::LogLevel::Warn, module, msg)

#define TALKPP_LOG_ERROR(module, msg) TALKPP_LOG_IMPL(::talkpp::log::LogLevel::Error, module, msg)

#define TALKPP_LOG_FATAL(module, msg) TALKPP_LOG_IMPL(::talkpp::log::LogLevel::Fatal, module, msg)

} // namespace talkpp::log

#endif // TALKPP_LOG_HPP
