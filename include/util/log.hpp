#pragma once

#include <iosfwd>
#include <string>

namespace e2e {

enum class LogLevel {
    Quiet = 0,   // errors only
    Warn  = 1,
    Info  = 2,
};

// Process-wide; set once by the executable before decoding.
void set_log_level(LogLevel level);

// Redirect log output (default std::cerr). Stream must outlive its use.
void set_log_stream(std::ostream& os);

void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

} // namespace e2e
