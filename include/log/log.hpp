//! # vcm Logging
//!
//! Leveled, module-tagged logging shared by the store, the session layer,
//! configuration loading and the command-line tool:
//! - 6 severity levels plus `Off`
//! - per-module filtering (`"store=debug,*=warn"`)
//! - console, file and null sinks behind one mutex
//! - compile-time elision below `VCM_MIN_LOG_LEVEL`
//!
//! The anchoring engine itself never logs. It returns orphans and results
//! and leaves reporting to its callers.
//!
//! ## Usage
//!
//! ```cpp
//! VCM_LOG_INFO("store", "Wrote " << set.records.size() << " records to " << path);
//! VCM_LOG_WARN("session", orphans << " comment(s) could not be re-anchored");
//! ```

#ifndef VCM_LOG_HPP
#define VCM_LOG_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace vcm::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Per-line tracing of anchoring passes
    Debug = 1, ///< Store paths, mode decisions
    Info = 2,  ///< Completed operations
    Warn = 3,  ///< Orphans, malformed stored data
    Error = 4, ///< Failed I/O
    Fatal = 5, ///< Unrecoverable
    Off = 6    ///< Disables all logging
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

/// Parses a level name in lower or upper case.
/// Unknown names map to `LogLevel::Info`.
inline LogLevel parse_level(std::string_view s) {
    if (s == "trace" || s == "TRACE")
        return LogLevel::Trace;
    if (s == "debug" || s == "DEBUG")
        return LogLevel::Debug;
    if (s == "info" || s == "INFO")
        return LogLevel::Info;
    if (s == "warn" || s == "WARN" || s == "warning")
        return LogLevel::Warn;
    if (s == "error" || s == "ERROR")
        return LogLevel::Error;
    if (s == "fatal" || s == "FATAL")
        return LogLevel::Fatal;
    if (s == "off" || s == "OFF")
        return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Log Record
// ============================================================================

/// One log message with its metadata.
struct LogRecord {
    LogLevel level;          ///< Severity
    std::string_view module; ///< Module tag ("store", "session", ...)
    std::string message;     ///< Formatted text
    const char* file;        ///< __FILE__
    int line;                ///< __LINE__
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format of the built-in sinks.
enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One JSON object per line
};

/// Renders a record in the given format, newline included.
/// Shared by every stream-backed sink.
void format_record(std::ostream& out, const LogRecord& record, LogFormat format,
                   const char* color = nullptr);

// ============================================================================
// Log Sinks
// ============================================================================

/// Destination of log records.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, colored when stderr is a terminal.
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

// ============================================================================
// Log Filter
// ============================================================================

/// Per-module level filter.
///
/// Parses specs like `"store=trace,session=debug,*=warn"`. A bare module name
/// enables everything from that module.
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

    /// Lowest level any module (or the default) accepts.
    LogLevel min_level() const {
        LogLevel min = default_level_;
        for (const auto& [_, level] : module_levels_) {
            if (level < min)
                min = level;
        }
        return min;
    }

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum level
    LogFormat format = LogFormat::Text; ///< Sink format
    std::string filter_spec;            ///< Module filter
    std::string log_file;               ///< Extra file sink (empty = none)
    bool console = true;                ///< stderr output
    bool colors = true;                 ///< ANSI colors on stderr
    bool level_from_cli = false;        ///< Level or filter came from argv/VCM_LOG
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Process-wide logger.
///
/// Usable before `init()`: it then logs Info and above to nothing until a
/// sink is added.
class Logger {
public:
    /// Replaces sinks, level and filter with the given configuration.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast check used by the macros before the message is formatted.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Drops every sink (tests use it to detach capture sinks).
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Info;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Time Helpers
// ============================================================================

/// Current local time as "HH:MM:SS.mmm".
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

/// Reads --log-level, --log-filter, --log-file, --log-format, -q and
/// -v/-vv/-vvv from argv, falling back to the VCM_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

/// Returns true for arguments consumed by `parse_log_options`.
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// 0=Trace ... 6=Off. Calls below this level compile to nothing.
#ifndef VCM_MIN_LOG_LEVEL
#define VCM_MIN_LOG_LEVEL 0
#endif

#define VCM_LOG_IMPL(level, module_str, msg)                                                       \
    do {                                                                                           \
        if (static_cast<int>(level) >= VCM_MIN_LOG_LEVEL) {                                        \
            auto& logger_ = ::vcm::log::Logger::instance();                                       \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define VCM_LOG_DEBUG(module, msg) VCM_LOG_IMPL(::vcm::log::LogLevel::Debug, module, msg)
#define VCM_LOG_INFO(module, msg) VCM_LOG_IMPL(::vcm::log::LogLevel::Info, module, msg)
#define VCM_LOG_WARN(module, msg) VCM_LOG_IMPL(::vcm::log::LogLevel::Warn, module, msg)
#define VCM_LOG_ERROR(module, msg) VCM_LOG_IMPL(::vcm::log::LogLevel::Error, module, msg)

} // namespace vcm::log

#endif // VCM_LOG_HPP
