#pragma once

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace embedded_mcp {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Where log lines go. Implementations are called with the logger's
// mutex held and need no locking of their own.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// Plain text to stderr.
class ConsoleSink : public ILogSink {
public:
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
};

// Compact colored text. Falls back to the ConsoleSink layout when
// use_color is false.
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// One JSON object per line: {"ts","level","component","message"}.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

// Appends to a file it owns, in plain or JSON-lines format.
class FileSink : public ILogSink {
public:
    FileSink(const std::string& path, bool json);

    [[nodiscard]] bool IsOpen() const { return file_.is_open(); }

    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ofstream file_;
    bool json_;
};

// Thread-safe logger that dispatches to a sink.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);

    void Debug(std::string_view component, std::string_view message);
    void Info(std::string_view component, std::string_view message);
    void Warn(std::string_view component, std::string_view message);
    void Error(std::string_view component, std::string_view message);

private:
    void Log(LogLevel level, std::string_view component,
             std::string_view message);

    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Global logger — set once at startup, used by all components.
// ---------------------------------------------------------------------------

/// Replace the global logger. Until this is called messages are discarded.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace embedded_mcp
