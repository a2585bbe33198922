#pragma once

#include <cstdarg>
#include <string>

#include "config.hpp"

namespace core {

class Logger {
public:
    static Logger& instance();

    // Applies logging settings (level, optional file sink).
    void init(const LoggingConfig& cfg);
    void shutdown();

    bool has_file_sink() const { return file_ != nullptr; }
    const std::string& file_path() const { return path_; }

private:
    Logger() = default;

    void* file_{nullptr};
    std::string path_{};
    bool callback_installed_{false};

    static void trace_callback(int logLevel, const char* text, va_list args);
};

} // namespace core
