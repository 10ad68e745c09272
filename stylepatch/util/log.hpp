#pragma once

#include <string>

namespace stylepatch::util {

enum class LogLevel : int {
    Trace = 0,
    Debug,
    Info,
    Warning,
    Error,
    None,
};

struct LogConfig {
    bool enabled{true};
    LogLevel level{LogLevel::Info};
    std::string file{};  // optional append-mode sink, mirrored to stderr
};

// Applies logging settings. Reopens the file sink if one is configured.
void log_init(const LogConfig& cfg);
void log_shutdown();

bool log_enabled(LogLevel level);

// Writes "[stylepatch][LEVEL][tag] message" to stderr (and the file sink).
void logf(LogLevel level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

const char* log_level_name(LogLevel level);

} // namespace stylepatch::util
