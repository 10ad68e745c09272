#include "log.hpp"

#include <cstdarg>
#include <cstdio>

namespace stylepatch::util {

namespace {

LogConfig g_log{};
FILE* g_file = nullptr;

} // namespace

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::None: return "NONE";
    }
    return "INFO";
}

void log_init(const LogConfig& cfg) {
    log_shutdown();

    g_log = cfg;

    if (g_log.enabled && !g_log.file.empty()) {
        g_file = std::fopen(g_log.file.c_str(), "a");
        if (!g_file) {
            std::fprintf(stderr, "[stylepatch][WARN][log] cannot open log file %s\n", g_log.file.c_str());
        }
    }
}

void log_shutdown() {
    if (g_file) {
        std::fclose(g_file);
        g_file = nullptr;
    }
}

bool log_enabled(LogLevel level) {
    if (!g_log.enabled) return false;
    if (level == LogLevel::None) return false;
    return static_cast<int>(level) >= static_cast<int>(g_log.level);
}

void logf(LogLevel level, const char* tag, const char* fmt, ...) {
    if (!log_enabled(level)) return;

    const char* levelStr = log_level_name(level);

    va_list args;
    va_start(args, fmt);

    if (g_file) {
        va_list argsCopy;
        va_copy(argsCopy, args);

        std::fprintf(g_file, "[stylepatch][%s][%s] ", levelStr, tag);
        std::vfprintf(g_file, fmt, argsCopy);
        std::fputc('\n', g_file);
        std::fflush(g_file);

        va_end(argsCopy);
    }

    std::fprintf(stderr, "[stylepatch][%s][%s] ", levelStr, tag);
    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);

    va_end(args);
}

} // namespace stylepatch::util
