//! # Logger Implementation
//!
//! Record formatting, the console and file sinks, module filtering, and the
//! process-wide `Logger`.

#include "log/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <unistd.h>
#include <utility>

namespace fwtest::log {

namespace {

struct LevelInfo {
    LogLevel level;
    const char* name;
    const char* color;
};

constexpr std::array<LevelInfo, 7> LEVELS = {{
    {LogLevel::Trace, "TRACE", "\033[90m"},
    {LogLevel::Debug, "DEBUG", "\033[36m"},
    {LogLevel::Info, "INFO", "\033[32m"},
    {LogLevel::Warn, "WARN", "\033[33m"},
    {LogLevel::Error, "ERROR", "\033[31m"},
    {LogLevel::Fatal, "FATAL", "\033[1;31m"},
    {LogLevel::Off, "OFF", ""},
}};

const LevelInfo& info_for(LogLevel level) {
    return LEVELS[static_cast<size_t>(level)];
}

bool stderr_supports_color() {
    if (!isatty(fileno(stderr))) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
}

void append_json_string(std::string& out, std::string_view text) {
    out += '"';
    for (char c : text) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char escaped[8];
                std::snprintf(escaped, sizeof(escaped), "\\u%04x", c);
                out += escaped;
            } else {
                out += c;
            }
        }
    }
    out += '"';
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

thread_local std::string thread_context;

} // namespace

// ============================================================================
// Levels and Formatting
// ============================================================================

const char* level_name(LogLevel level) {
    return info_for(level).name;
}

std::optional<LogLevel> parse_level(std::string_view name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "WARNING") {
        return LogLevel::Warn;
    }
    for (const auto& info : LEVELS) {
        if (upper == info.name) {
            return info.level;
        }
    }
    return std::nullopt;
}

int64_t epoch_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string clock_time(int64_t timestamp_ms) {
    std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm local{};
    localtime_r(&seconds, &local);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d.%03d", local.tm_hour, local.tm_min,
                  local.tm_sec, static_cast<int>(timestamp_ms % 1000));
    return buffer;
}

std::string format_record(const LogRecord& record, LogFormat format, bool colors) {
    std::string line;
    if (format == LogFormat::JSON) {
        line = "{\"ts\":" + std::to_string(record.timestamp_ms) + ",\"level\":";
        append_json_string(line, level_name(record.level));
        line += ",\"module\":";
        append_json_string(line, record.module);
        if (!record.context.empty()) {
            line += ",\"test\":";
            append_json_string(line, record.context);
        }
        line += ",\"msg\":";
        append_json_string(line, record.message);
        line += "}\n";
        return line;
    }

    std::string level = level_name(record.level);
    level.resize(5, ' ');
    line = clock_time(record.timestamp_ms) + " ";
    if (colors) {
        line += info_for(record.level).color + level + "\033[0m";
    } else {
        line += level;
    }
    line += " [" + record.module + "] ";
    if (!record.context.empty()) {
        line += "(" + record.context + ") ";
    }
    line += record.message;
    line += '\n';
    return line;
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(LogFormat format, bool colors)
    : format_(format), colors_(colors && format == LogFormat::Text && stderr_supports_color()) {}

void ConsoleSink::write(const LogRecord& record) {
    std::cerr << format_record(record, format_, colors_);
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const std::string& path, LogFormat format, bool append)
    : file_(path, append ? std::ios::app : std::ios::trunc), format_(format) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    file_ << format_record(record, format_, false);
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
// LogFilter
// ============================================================================

bool LogFilter::parse(std::string_view spec) {
    modules_.clear();
    bool clean = true;

    while (!spec.empty()) {
        size_t comma = spec.find(',');
        std::string_view token = trim(spec.substr(0, comma));
        spec = comma == std::string_view::npos ? std::string_view{} : spec.substr(comma + 1);
        if (token.empty()) {
            continue;
        }

        size_t eq = token.find('=');
        std::string_view module = trim(token.substr(0, eq));
        std::optional<LogLevel> level = LogLevel::Trace;
        if (eq != std::string_view::npos) {
            level = parse_level(trim(token.substr(eq + 1)));
        }
        if (!level || module.empty()) {
            clean = false;
            continue;
        }

        if (module == "*") {
            default_level_ = *level;
        } else {
            modules_.insert_or_assign(std::string(module), *level);
        }
    }
    return clean;
}

bool LogFilter::allows(LogLevel level, std::string_view module) const {
    if (level == LogLevel::Off) {
        return false;
    }
    auto it = modules_.find(module);
    LogLevel threshold = it == modules_.end() ? default_level_ : it->second;
    return level >= threshold;
}

LogLevel LogFilter::lowest_level() const {
    LogLevel lowest = default_level_;
    for (const auto& [module, level] : modules_) {
        lowest = std::min(lowest, level);
    }
    return lowest;
}

// ============================================================================
// ScopedLogContext
// ============================================================================

ScopedLogContext::ScopedLogContext(std::string context)
    : previous_(std::exchange(thread_context, std::move(context))) {}

ScopedLogContext::~ScopedLogContext() {
    thread_context = std::move(previous_);
}

const std::string& current_context() {
    return thread_context;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    sinks_.push_back(std::make_unique<ConsoleSink>(LogFormat::Text, true));
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    filter_ = LogFilter(config.level);
    if (!config.filter.empty() && !filter_.parse(config.filter)) {
        std::cerr << "warning: ignoring malformed entries in log filter '" << config.filter
                  << "'\n";
    }
    floor_ = filter_.lowest_level();

    sinks_.clear();
    sinks_.push_back(std::make_unique<ConsoleSink>(config.format, config.colors));
    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file, config.format);
        if (file->is_open()) {
            sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: cannot open log file " << config.log_file << "\n";
        }
    }
}

bool Logger::enabled(LogLevel level, std::string_view module) const {
    if (level < floor_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.allows(level, module);
}

void Logger::write(LogLevel level, std::string_view module, std::string message,
                   const char* file, int line) {
    LogRecord record;
    record.level = level;
    record.module = std::string(module);
    record.context = current_context();
    record.message = std::move(message);
    record.file = file;
    record.line = line;
    record.timestamp_ms = epoch_ms();

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

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_ = LogFilter(level);
    floor_ = level;
}

bool Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool clean = filter_.parse(spec);
    floor_ = filter_.lowest_level();
    return clean;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace fwtest::log
