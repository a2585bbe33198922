#include "logger.hpp"

#include <chrono>
#include <cstdio>

#include <raylib.h>

namespace core {

static Logger* g_logger = nullptr;

namespace {

// GetTime() needs a window; headless runs log before one exists.
double seconds_since_start() {
    static const auto start = std::chrono::steady_clock::now();
    const auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - start).count();
}

const char* level_name(int logLevel) {
    switch (logLevel) {
        case LOG_ALL: return "ALL";
        case LOG_TRACE: return "TRACE";
        case LOG_DEBUG: return "DEBUG";
        case LOG_INFO: return "INFO";
        case LOG_WARNING: return "WARN";
        case LOG_ERROR: return "ERROR";
        case LOG_FATAL: return "FATAL";
        case LOG_NONE: return "NONE";
        default: return "INFO";
    }
}

void write_line(FILE* out, double t, const char* level, const char* text, va_list args) {
    std::fprintf(out, "[%.3f][%s] ", t, level);
    std::vfprintf(out, text, args);
    std::fputc('\n', out);
}

} // namespace

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::init(const LoggingConfig& cfg) {
    g_logger = this;

    shutdown();
    seconds_since_start();

    if (!cfg.enabled) {
        SetTraceLogLevel(LOG_NONE);
        return;
    }

    SetTraceLogLevel(cfg.level);

    if (!cfg.file.empty()) {
        file_ = std::fopen(cfg.file.c_str(), "a");
        if (file_) {
            path_ = cfg.file;
            SetTraceLogCallback(&Logger::trace_callback);
            callback_installed_ = true;
        } else {
            TraceLog(LOG_WARNING, "[log] Cannot open log file '%s', logging to stderr only", cfg.file.c_str());
        }
    }
}

void Logger::shutdown() {
    if (callback_installed_) {
        SetTraceLogCallback(nullptr);
    }

    if (file_) {
        std::fclose(static_cast<FILE*>(file_));
        file_ = nullptr;
    }

    path_.clear();
    callback_installed_ = false;
}

void Logger::trace_callback(int logLevel, const char* text, va_list args) {
    const char* level_str = level_name(logLevel);
    const double t = seconds_since_start();

    FILE* sink = g_logger ? static_cast<FILE*>(g_logger->file_) : nullptr;
    if (!sink) {
        write_line(stderr, t, level_str, text, args);
        return;
    }

    va_list args_copy;
    va_copy(args_copy, args);

    write_line(sink, t, level_str, text, args);
    std::fflush(sink);

    write_line(stderr, t, level_str, text, args_copy);

    va_end(args_copy);
}

} // namespace core
