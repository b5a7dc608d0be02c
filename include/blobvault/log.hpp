#pragma once

#include <string>

namespace blobvault {

/// printf-style logging shared by the daemon, the admin tool and the core.
///
/// info/debug lines go to stdout, warn/error lines to stderr. Every line is
/// prefixed with a local timestamp. Debug output is dropped unless verbose
/// logging has been enabled.

void set_verbose_logging(bool enabled);
bool verbose_logging();

void log_debug(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_warn(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

/// First characters of a key followed by "...", for log output.
std::string redact_key(const std::string& key);

}  // namespace blobvault
