#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "common/result.h"

namespace logging {

enum class Type { SpdLog };
enum class Level { Trace, Debug, Info, Warn, Error, Fatal, Off };

// Settings under this tag apply to every logger that has no sinks of its own.
inline constexpr std::string_view GLOBAL_TAG = "*";

inline constexpr const char* DEFAULT_TAG = "CommandRunner";

inline std::optional<Level> parseLevel(std::string_view s) {
    if (s == "trace") return Level::Trace;
    if (s == "debug") return Level::Debug;
    if (s == "info")  return Level::Info;
    if (s == "warn" || s == "warning") return Level::Warn;
    if (s == "error") return Level::Error;
    if (s == "fatal" || s == "critical") return Level::Fatal;
    if (s == "off")   return Level::Off;
    return std::nullopt;
}

inline const char* to_string(Level level) {
    switch (level) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warn";
        case Level::Error: return "error";
        case Level::Fatal: return "fatal";
        case Level::Off:   return "off";
    }
    return "off";
}

// Per-tag logger with pluggable sinks. Every tag also writes to the
// sinks registered under GLOBAL_TAG.
class LoggerBackend {
public:
    virtual ~LoggerBackend() = default;
    virtual Result<void> init() = 0;
    virtual Result<void> shutdown() = 0;
    virtual Result<void> registerLogger(const std::string& tag) = 0;
    virtual Result<void> setLevel(const std::string& tag, Level level) = 0;
    virtual void log(const std::string& tag, Level level, const std::string& msg) = 0;

    virtual Result<void> enableTag(const std::string& tag) = 0;
    virtual Result<void> disableTag(const std::string& tag) = 0;

    // sinks
    virtual Result<void> setConsoleSink(const std::string& tag) = 0;
    virtual Result<void> setFileSink(const std::string& tag, const std::string& filename) = 0;
    virtual Result<void> setRotatingFileSink(const std::string& tag,
                                             const std::string& filename,
                                             size_t max_size,
                                             size_t max_files) = 0;
    virtual Result<void> setSyslogSink(const std::string& tag, const std::string& ident) = 0;
};

} // namespace logging
