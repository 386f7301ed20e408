//! # fwtest Logging
//!
//! Module-tagged, level-filtered logging for the harness.
//!
//! | Piece              | Role                                                   |
//! |--------------------|--------------------------------------------------------|
//! | `LogLevel`         | Trace..Fatal, plus Off                                 |
//! | `LogFilter`        | Per-module thresholds, e.g. `process=trace,*=warn`     |
//! | `ConsoleSink`      | stderr, ANSI colors when attached to a terminal        |
//! | `FileSink`         | `--log-file=<path>`, flushed on errors                 |
//! | `ScopedLogContext` | Tags every record of the current thread with a test    |
//! | `Logger`           | Process-wide dispatcher, safe to call from any thread  |
//!
//! Parallel `run` workers each set a `ScopedLogContext` with the test name, so
//! interleaved lines stay attributable:
//!
//! ```text
//! 14:02:11.084 INFO  [builder] (values) Compiling values for ios_arm64
//! ```
//!
//! ## Usage
//!
//! ```cpp
//! FWTEST_LOG_INFO("builder", "Compiling " << name << " for " << target_name(target));
//! FWTEST_LOG_DEBUG("process", "spawn: " << command);
//! ```

#ifndef FWTEST_LOG_HPP
#define FWTEST_LOG_HPP

#include <atomic>
#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace fwtest::log {

// ============================================================================
// Levels
// ============================================================================

enum class LogLevel : int { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Fatal = 5, Off = 6 };

/// Upper-case name ("TRACE", "WARN", ...).
const char* level_name(LogLevel level);

/// Case-insensitive level name; `std::nullopt` when unrecognized.
std::optional<LogLevel> parse_level(std::string_view name);

// ============================================================================
// Records and Formatting
// ============================================================================

enum class LogFormat { Text, JSON };

struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string module;    ///< Component tag ("driver", "process", ...)
    std::string context;   ///< Test being processed on this thread, if any
    std::string message;
    const char* file = ""; ///< __FILE__ of the call site
    int line = 0;
    int64_t timestamp_ms = 0;
};

/// Wall-clock milliseconds since the epoch.
int64_t epoch_ms();

/// Local time of `timestamp_ms` as "HH:MM:SS.mmm".
std::string clock_time(int64_t timestamp_ms);

/// One output line (with trailing newline) for `record`.
std::string format_record(const LogRecord& record, LogFormat format, bool colors);

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() {}
};

class ConsoleSink : public LogSink {
public:
    ConsoleSink(LogFormat format, bool colors);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    LogFormat format_;
    bool colors_;
};

class FileSink : public LogSink {
public:
    FileSink(const std::string& path, LogFormat format, bool append = true);

    bool is_open() const {
        return file_.is_open();
    }

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::ofstream file_;
    LogFormat format_;
};

// ============================================================================
// Filter
// ============================================================================

/// Per-module thresholds with a default for unlisted modules.
///
/// `"process=trace,driver=debug,*=warn"`; a bare module name means Trace.
class LogFilter {
public:
    explicit LogFilter(LogLevel default_level = LogLevel::Info) : default_level_(default_level) {}

    /// Replaces the module rules with those in `spec`. Tokens with an unknown
    /// level are skipped; returns false if any were.
    bool parse(std::string_view spec);

    bool allows(LogLevel level, std::string_view module) const;

    LogLevel default_level() const {
        return default_level_;
    }
    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    /// Most verbose threshold in effect for any module.
    LogLevel lowest_level() const;

private:
    LogLevel default_level_;
    std::map<std::string, LogLevel, std::less<>> modules_;
};

// ============================================================================
// Thread Context
// ============================================================================

/// Sets the context tag of the calling thread for its lifetime.
class ScopedLogContext {
public:
    explicit ScopedLogContext(std::string context);
    ~ScopedLogContext();

    ScopedLogContext(const ScopedLogContext&) = delete;
    ScopedLogContext& operator=(const ScopedLogContext&) = delete;

private:
    std::string previous_;
};

/// Context tag of the calling thread ("" outside any scope).
const std::string& current_context();

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    std::string filter;   ///< Module rules; overrides `level` where they apply
    std::string log_file; ///< Extra file output when non-empty
    LogFormat format = LogFormat::Text;
    bool colors = true;   ///< Console colors (still requires a terminal)
};

class Logger {
public:
    static Logger& instance();

    /// Replaces sinks and thresholds. A log file that cannot be opened is
    /// reported on stderr and skipped.
    void configure(const LogConfig& config);

    /// Cheap check used by the macros before the message is formatted.
    bool enabled(LogLevel level, std::string_view module) const;

    void write(LogLevel level, std::string_view module, std::string message, const char* file,
               int line);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();

    /// Sets the default threshold and drops module rules.
    void set_level(LogLevel level);

    /// Installs module rules; `*=level` sets the default. False if any entry
    /// was malformed.
    bool set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    mutable std::mutex mutex_;
    LogFilter filter_;
    std::atomic<LogLevel> floor_{LogLevel::Info}; ///< `filter_.lowest_level()`, checked unlocked
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

// ============================================================================
// Command Line
// ============================================================================

/// Logging options from argv:
/// `--log-level=`, `--log-filter=`, `--log-file=`, `--log-format=`,
/// `-v`/`-vv`/`-vvv`, `-q`, `--no-color`.
/// Without a level or filter on the command line, `FWTEST_LOG` is consulted
/// (a level name or a filter).
LogConfig parse_log_options(int argc, char* argv[]);

// ============================================================================
// Macros
// ============================================================================

// Levels below this are compiled out (0=Trace ... 6=Off)
#ifndef FWTEST_MIN_LOG_LEVEL
#define FWTEST_MIN_LOG_LEVEL 0
#endif

#define FWTEST_LOG_IMPL(level, module, msg)                                                        \
    do {                                                                                           \
        if (static_cast<int>(level) >= FWTEST_MIN_LOG_LEVEL) {                                     \
            auto& fwtest_logger_ = ::fwtest::log::Logger::instance();                              \
            if (fwtest_logger_.enabled(level, module)) {                                           \
                std::ostringstream fwtest_msg_;                                                    \
                fwtest_msg_ << msg;                                                                \
                fwtest_logger_.write(level, module, fwtest_msg_.str(), __FILE__, __LINE__);        \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define FWTEST_LOG_TRACE(module, msg) FWTEST_LOG_IMPL(::fwtest::log::LogLevel::Trace, module, msg)
#define FWTEST_LOG_DEBUG(module, msg) FWTEST_LOG_IMPL(::fwtest::log::LogLevel::Debug, module, msg)
#define FWTEST_LOG_INFO(module, msg) FWTEST_LOG_IMPL(::fwtest::log::LogLevel::Info, module, msg)
#define FWTEST_LOG_WARN(module, msg) FWTEST_LOG_IMPL(::fwtest::log::LogLevel::Warn, module, msg)
#define FWTEST_LOG_ERROR(module, msg) FWTEST_LOG_IMPL(::fwtest::log::LogLevel::Error, module, msg)
#define FWTEST_LOG_FATAL(module, msg) FWTEST_LOG_IMPL(::fwtest::log::LogLevel::Fatal, module, msg)

} // namespace fwtest::log

#endif // FWTEST_LOG_HPP
