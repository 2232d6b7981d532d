#include "utils.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <mutex>
#include <system_error>

namespace {
    std::mutex g_log_mutex;
    std::ofstream g_log_file;
    bool g_debug = false;
}

void log_message(const char* level, const char* fmt, ...) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_debug && std::strcmp(level, "DEBUG") == 0) {
        return;
    }

    char body[1024];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(body, sizeof(body), fmt, args);
    va_end(args);

    const std::string ts = get_timestamp();
    std::fprintf(stderr, "[%s] [%s] %s\n", ts.c_str(), level, body);
    if (g_log_file.is_open()) {
        g_log_file << "[" << ts << "] [" << level << "] " << body << "\n";
        g_log_file.flush();
    }
}

std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf{};
    localtime_r(&in_time_t, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %X");
    return ss.str();
}

void initialize_logging(const std::string& path, bool debug) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_debug = debug;
    if (g_log_file.is_open()) {
        g_log_file.close();
    }
    if (!path.empty()) {
        g_log_file.open(path, std::ios::app);
        if (g_log_file) {
            g_log_file << "[" << get_timestamp() << "] [INFO] Logging initialized" << (debug ? " (debug)" : "") << "\n";
        } else {
            std::fprintf(stderr, "[%s] [WARN] cannot open log file %s\n", get_timestamp().c_str(), path.c_str());
        }
    }
}

std::string error_to_string(int errnum) {
    return std::system_category().message(errnum);
}
