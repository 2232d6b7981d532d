#pragma once

#include <string>

#define LOG_DEBUG(fmt, ...) log_message("DEBUG", fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) log_message("INFO", fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) log_message("ERROR", fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) log_message("WARN", fmt, ##__VA_ARGS__)

// DEBUG lines are dropped unless initialize_logging() enabled them.
void log_message(const char* level, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

std::string get_timestamp();

// Mirrors every line to `path` (appended) when non-empty.
void initialize_logging(const std::string& path, bool debug);

std::string error_to_string(int errnum);
