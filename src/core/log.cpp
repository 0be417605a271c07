#include <embedded_mcp/core/log.hpp>
#include <embedded_mcp/core/ansi.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace embedded_mcp {

namespace {

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

// Fixed-width level tag for the colored layout.
const char* LevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
    }
    return "     ";
}

const char* LevelAnsi(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return ansi::kDim;
        case LogLevel::Info:  return ansi::kCyan;
        case LogLevel::Warn:  return ansi::kYellow;
        case LogLevel::Error: return ansi::kRed;
    }
    return "";
}

std::tm ToTm(std::time_t t, bool utc) {
    std::tm out{};
#ifdef _WIN32
    if (utc) gmtime_s(&out, &t); else localtime_s(&out, &t);
#else
    if (utc) gmtime_r(&t, &out); else localtime_r(&t, &out);
#endif
    return out;
}

std::string Iso8601Now() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    const auto tm = ToTm(std::chrono::system_clock::to_time_t(now), true);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << 'Z';
    return oss.str();
}

std::string HhMmSsNow() {
    const auto tm = ToTm(
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()),
        false);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S");
    return oss.str();
}

void JsonEscape(std::ostream& out, std::string_view s) {
    for (char c : s) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n";  break;
            case '\r': out << "\\r";  break;
            case '\t': out << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u"
                        << std::hex << std::setfill('0') << std::setw(4)
                        << static_cast<int>(static_cast<unsigned char>(c))
                        << std::dec;
                } else {
                    out << c;
                }
                break;
        }
    }
}

void WritePlain(std::ostream& out, LogLevel level, std::string_view component,
                std::string_view message) {
    out << Iso8601Now()
        << " [" << LevelName(level) << "] "
        << "[" << component << "] "
        << message << '\n';
}

void WriteJsonLine(std::ostream& out, LogLevel level,
                   std::string_view component, std::string_view message) {
    out << "{\"ts\":\"" << Iso8601Now()
        << "\",\"level\":\"" << LevelName(level)
        << "\",\"component\":\"";
    JsonEscape(out, component);
    out << "\",\"message\":\"";
    JsonEscape(out, message);
    out << "\"}\n";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ConsoleSink
// ---------------------------------------------------------------------------
void ConsoleSink::Write(LogLevel level, std::string_view component,
                        std::string_view message) {
    WritePlain(std::cerr, level, component, message);
}

// ---------------------------------------------------------------------------
// ColorConsoleSink
// ---------------------------------------------------------------------------
ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(LogLevel level, std::string_view component,
                             std::string_view message) {
    if (!use_color_) {
        WritePlain(out_, level, component, message);
        return;
    }

    // HH:MM:SS LEVEL [component] message
    const auto* level_color = LevelAnsi(level);
    out_ << ansi::kDim << HhMmSsNow() << ansi::kReset << ' ';
    out_ << level_color << LevelTag(level) << ansi::kReset << ' ';
    out_ << ansi::kDim << '[' << component << ']' << ansi::kReset << ' ';
    if (level == LogLevel::Error) {
        out_ << level_color << message << ansi::kReset;
    } else {
        out_ << message;
    }
    out_ << '\n';
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    WriteJsonLine(out_, level, component, message);
}

// ---------------------------------------------------------------------------
// FileSink
// ---------------------------------------------------------------------------
FileSink::FileSink(const std::string& path, bool json)
    : file_(path, std::ios::out | std::ios::app), json_(json) {}

void FileSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    if (!file_.is_open()) return;
    if (json_) {
        WriteJsonLine(file_, level, component, message);
    } else {
        WritePlain(file_, level, component, message);
    }
    file_.flush();
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

void Logger::Debug(std::string_view component, std::string_view message) {
    Log(LogLevel::Debug, component, message);
}

void Logger::Info(std::string_view component, std::string_view message) {
    Log(LogLevel::Info, component, message);
}

void Logger::Warn(std::string_view component, std::string_view message) {
    Log(LogLevel::Warn, component, message);
}

void Logger::Error(std::string_view component, std::string_view message) {
    Log(LogLevel::Error, component, message);
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) >= static_cast<int>(min_level_)) {
        sink_->Write(level, component, message);
    }
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
namespace {

class NullSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

std::unique_ptr<Logger>& GlobalLoggerInstance() {
    static auto instance = std::make_unique<Logger>(
        std::make_unique<NullSink>(), LogLevel::Error);
    return instance;
}

} // anonymous namespace

void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLoggerInstance() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalLoggerInstance();
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Debug(component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Info(component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Warn(component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Error(component, message);
}

} // namespace embedded_mcp
