#include "blobvault/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace blobvault {

namespace {

std::atomic<bool> g_verbose{false};
std::mutex g_log_mutex;

void write_line(FILE* out, const char* level, const char* fmt, va_list args) {
    char stamp[32];
    time_t now = time(nullptr);
    struct tm tm_val;
    localtime_r(&now, &tm_val);
    strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_val);

    std::lock_guard lock(g_log_mutex);
    fprintf(out, "%s %s ", stamp, level);
    vfprintf(out, fmt, args);
    fputc('\n', out);
    fflush(out);
}

}  // namespace

void set_verbose_logging(bool enabled) {
    g_verbose.store(enabled, std::memory_order_relaxed);
}

bool verbose_logging() {
    return g_verbose.load(std::memory_order_relaxed);
}

void log_debug(const char* fmt, ...) {
    if (!verbose_logging()) return;
    va_list args;
    va_start(args, fmt);
    write_line(stdout, "DEBUG", fmt, args);
    va_end(args);
}

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stdout, "INFO", fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stderr, "WARN", fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_line(stderr, "ERROR", fmt, args);
    va_end(args);
}

std::string redact_key(const std::string& key) {
    if (key.size() <= 8) return key;
    return key.substr(0, 8) + "...";
}

}  // namespace blobvault
