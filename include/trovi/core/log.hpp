#pragma once

namespace trovi {

void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

// Only printed when verbose logging is enabled
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

void set_verbose_logging(bool verbose);
bool verbose_logging();

}  // namespace trovi
