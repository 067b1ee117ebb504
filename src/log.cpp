#include "trovi/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace trovi {

namespace {

std::atomic<bool> g_verbose{false};

// Keeps lines from concurrent threads (migration worker, upload tasks) intact
std::mutex g_log_mutex;

void vlog(FILE* stream, const char* prefix, const char* fmt, va_list args) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (prefix) fputs(prefix, stream);
    vfprintf(stream, fmt, args);
    fputc('\n', stream);
    fflush(stream);
}

}  // namespace

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stdout, nullptr, fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stderr, "WARNING: ", fmt, args);
    va_end(args);
}

void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlog(stderr, "ERROR: ", fmt, args);
    va_end(args);
}

void log_debug(const char* fmt, ...) {
    if (!g_verbose.load(std::memory_order_relaxed)) return;
    va_list args;
    va_start(args, fmt);
    vlog(stdout, "DEBUG: ", fmt, args);
    va_end(args);
}

void set_verbose_logging(bool verbose) {
    g_verbose.store(verbose, std::memory_order_relaxed);
}

bool verbose_logging() {
    return g_verbose.load(std::memory_order_relaxed);
}

}  // namespace trovi
