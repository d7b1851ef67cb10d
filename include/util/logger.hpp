#pragma once

#include <cstdarg>
#include <optional>
#include <string_view>

namespace filetar {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

// "debug", "info", "warn", "error", "none" (case-sensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view s);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Applies FILETAR_LOG_LEVEL when it is set to a known level.
    void ApplyEnvironment();

    void Log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);

private:
    Logger() = default;
};

#define LogDebug(...) ::filetar::Logger::Instance().LogWithSource(::filetar::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::filetar::Logger::Instance().LogWithSource(::filetar::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::filetar::Logger::Instance().LogWithSource(::filetar::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::filetar::Logger::Instance().LogWithSource(::filetar::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace filetar
