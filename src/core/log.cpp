#include <mcp_bridge/core/log.hpp>
#include <mcp_bridge/core/ansi.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mcp_bridge {

namespace {

enum class Clock { UtcIso8601, LocalTime };

std::string Timestamp(Clock clock) {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);

    std::tm parts{};
    std::ostringstream oss;
    if (clock == Clock::LocalTime) {
        localtime_r(&seconds, &parts);
        oss << std::put_time(&parts, "%H:%M:%S");
        return oss.str();
    }

    gmtime_r(&seconds, &parts);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    oss << std::put_time(&parts, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

const char* LevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return ansi::kDim;
        case LogLevel::Info:  return ansi::kCyan;
        case LogLevel::Warn:  return ansi::kYellow;
        case LogLevel::Error: return ansi::kRed;
    }
    return ansi::kReset;
}

void WritePlainLine(std::ostream& out, LogLevel level,
                    std::string_view component, std::string_view message) {
    out << Timestamp(Clock::UtcIso8601) << " [" << LogLevelName(level) << "] ["
        << component << "] " << message << '\n';
}

class NullSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

std::unique_ptr<Logger> MakeSilentLogger() {
    return std::make_unique<Logger>(std::make_unique<NullSink>(), LogLevel::Error);
}

std::unique_ptr<Logger>& GlobalLoggerSlot() {
    static std::unique_ptr<Logger> slot = MakeSilentLogger();
    return slot;
}

} // anonymous namespace

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel LogLevelFromFlags(bool verbose, bool quiet) {
    if (verbose) return LogLevel::Debug;
    if (quiet) return LogLevel::Error;
    return LogLevel::Warn;
}

// ---------------------------------------------------------------------------
// Sinks
// ---------------------------------------------------------------------------
ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(LogLevel level, std::string_view component,
                             std::string_view message) {
    if (!use_color_) {
        WritePlainLine(out_, level, component, message);
        return;
    }

    const auto* color = LevelColor(level);
    out_ << ansi::kDim << Timestamp(Clock::LocalTime) << ansi::kReset << ' '
         << color << std::left << std::setw(5) << LogLevelName(level) << ansi::kReset << ' '
         << ansi::kDim << '[' << component << ']' << ansi::kReset << ' ';
    if (level == LogLevel::Error) {
        out_ << color << message << ansi::kReset << '\n';
    } else {
        out_ << message << '\n';
    }
}

JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    nlohmann::json line = {
        {"ts", Timestamp(Clock::UtcIso8601)},
        {"level", LogLevelName(level)},
        {"component", std::string(component)},
        {"message", std::string(message)},
    };
    // Provider output may carry invalid UTF-8; replace rather than throw.
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
}

FileSink::FileSink(const std::string& path)
    : out_(path, std::ios::out | std::ios::app) {}

void FileSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    if (!out_.is_open()) {
        return;
    }
    WritePlainLine(out_, level, component, message);
    out_.flush();
}

TeeSink::TeeSink(std::unique_ptr<ILogSink> first, std::unique_ptr<ILogSink> second)
    : first_(std::move(first)), second_(std::move(second)) {}

void TeeSink::Write(LogLevel level, std::string_view component,
                    std::string_view message) {
    for (auto* sink : {first_.get(), second_.get()}) {
        if (sink != nullptr) {
            sink->Write(level, component, message);
        }
    }
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

bool Logger::IsEnabled(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level >= min_level_) {
        sink_->Write(level, component, message);
    }
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLoggerSlot() = std::make_unique<Logger>(std::move(sink), min_level);
}

void ResetGlobalLogger() {
    GlobalLoggerSlot() = MakeSilentLogger();
}

Logger& GlobalLogger() {
    return *GlobalLoggerSlot();
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

} // namespace mcp_bridge
