#pragma once

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace mcp_bridge {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

const char* LogLevelName(LogLevel level);

/// --verbose wins over the default (Warn); --quiet keeps errors only.
LogLevel LogLevelFromFlags(bool verbose, bool quiet);

// ---------------------------------------------------------------------------
// Sinks. A sink is only ever called with the Logger's mutex held, so
// implementations need no locking of their own.
// ---------------------------------------------------------------------------
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// Terminal sink. With color: "HH:MM:SS LEVEL [component] message".
// Without: "<iso8601> [LEVEL] [component] message", the file format.
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// One JSON object per line: {"ts", "level", "component", "message"}.
// Used with --json so that stderr stays machine-readable.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

// Appends plain lines to --log-file and flushes each one.
// IsOpen() is false when the file could not be opened; writes are dropped.
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path);
    [[nodiscard]] bool IsOpen() const { return out_.is_open(); }
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ofstream out_;
};

// Console plus log file.
class TeeSink : public ILogSink {
public:
    TeeSink(std::unique_ptr<ILogSink> first, std::unique_ptr<ILogSink> second);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::unique_ptr<ILogSink> first_;
    std::unique_ptr<ILogSink> second_;
};

// ---------------------------------------------------------------------------
// Logger: level filter in front of one sink. Provider reader threads and
// caller threads log concurrently; every write holds the mutex.
// ---------------------------------------------------------------------------
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);
    [[nodiscard]] bool IsEnabled(LogLevel level);

    void Log(LogLevel level, std::string_view component, std::string_view message);

    void Debug(std::string_view component, std::string_view message) {
        Log(LogLevel::Debug, component, message);
    }
    void Info(std::string_view component, std::string_view message) {
        Log(LogLevel::Info, component, message);
    }
    void Warn(std::string_view component, std::string_view message) {
        Log(LogLevel::Warn, component, message);
    }
    void Error(std::string_view component, std::string_view message) {
        Log(LogLevel::Error, component, message);
    }

private:
    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Global logger. Until InitGlobalLogger() runs, messages are discarded.
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

/// Back to the silent default.
void ResetGlobalLogger();

Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace mcp_bridge
