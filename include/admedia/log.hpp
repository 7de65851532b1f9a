#pragma once

namespace admedia {

/// Enable or disable debug-level log lines (off by default).
void set_verbose_logging(bool verbose);
bool verbose_logging();

// printf-style loggers. Info and debug go to stdout, warnings and errors
// to stderr.
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace admedia
