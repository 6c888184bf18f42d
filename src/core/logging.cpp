#include "launchpad/core/logging.hpp"

#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace launchpad {

// ============================================================================
// Level Utilities
// ============================================================================

std::string_view log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
        default: return "UNKNOWN";
    }
}

LogLevel parse_log_level(std::string_view name) noexcept {
    if (name == "trace" || name == "TRACE") return LogLevel::Trace;
    if (name == "debug" || name == "DEBUG") return LogLevel::Debug;
    if (name == "info" || name == "INFO") return LogLevel::Info;
    if (name == "warn" || name == "WARN" || name == "warning" || name == "WARNING") return LogLevel::Warn;
    if (name == "error" || name == "ERROR") return LogLevel::Error;
    if (name == "fatal" || name == "FATAL") return LogLevel::Fatal;
    if (name == "off" || name == "OFF" || name == "silent") return LogLevel::Off;
    return LogLevel::Info;
}

LogFormat parse_log_format(std::string_view name) noexcept {
    if (name == "json" || name == "JSON") return LogFormat::Json;
    return LogFormat::Text;
}

namespace {

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";      // Gray
        case LogLevel::Debug: return "\033[36m";      // Cyan
        case LogLevel::Info:  return "\033[32m";      // Green
        case LogLevel::Warn:  return "\033[33m";      // Yellow
        case LogLevel::Error: return "\033[31m";      // Red
        case LogLevel::Fatal: return "\033[35m";      // Magenta
        default: return "\033[0m";
    }
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

void write_json_string(std::ostream& out, std::string_view s) {
    out << '"';
    for (char c : s) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec << std::setfill(' ');
                } else {
                    out << c;
                }
        }
    }
    out << '"';
}

} // anonymous namespace

// ============================================================================
// Console Sink
// ============================================================================

void ConsoleSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ostringstream oss;
    oss << format_timestamp(entry.timestamp) << " ";

    if (colored_) {
        oss << level_color(entry.level);
    }
    oss << "[" << log_level_name(entry.level) << "]";
    if (colored_) {
        oss << "\033[0m";
    }

    if (!entry.logger_name.empty()) {
        oss << " [" << entry.logger_name << "]";
    }

    oss << " " << entry.message;

    for (const auto& [key, value] : entry.fields) {
        oss << " " << key << "=" << value;
    }

    oss << "\n";

    std::cerr << oss.str();
}

// ============================================================================
// JSON Sink
// ============================================================================

void JsonSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    out_ << "{\"timestamp\":\"" << format_timestamp(entry.timestamp) << "\"";
    out_ << ",\"level\":\"" << log_level_name(entry.level) << "\"";

    if (!entry.logger_name.empty()) {
        out_ << ",\"logger\":";
        write_json_string(out_, entry.logger_name);
    }

    out_ << ",\"message\":";
    write_json_string(out_, entry.message);

    for (const auto& [key, value] : entry.fields) {
        out_ << ",";
        write_json_string(out_, key);
        out_ << ":";
        write_json_string(out_, value);
    }

    out_ << "}\n";
}

void JsonSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_.flush();
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
    return *this;
}

Logger& Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
    return *this;
}

void Logger::log(LogLevel level, std::string message) const {
    if (level < level_) return;
    log(entry(level, std::move(message)));
}

LogEntry Logger::entry(LogLevel level, std::string message) const {
    LogEntry e;
    e.level = level;
    e.timestamp = std::chrono::system_clock::now();
    e.message = std::move(message);
    e.logger_name = name_;
    return e;
}

void Logger::log(const LogEntry& entry) const {
    if (entry.level < level_) return;

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->write(entry);
    }
}

// ============================================================================
// Global Logger
// ============================================================================

Logger& default_logger() {
    static Logger logger("launchpad");
    static bool initialized = [] {
        logger.add_sink(std::make_shared<ConsoleSink>(::isatty(STDERR_FILENO) == 1));
        return true;
    }();
    (void)initialized;
    return logger;
}

void configure_default_logger(LogLevel level, LogFormat format) {
    auto& logger = default_logger();
    logger.set_level(level);
    logger.clear_sinks();
    if (format == LogFormat::Json) {
        logger.add_sink(std::make_shared<JsonSink>());
    } else {
        logger.add_sink(std::make_shared<ConsoleSink>(::isatty(STDERR_FILENO) == 1));
    }
}

} // namespace launchpad
