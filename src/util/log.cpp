#include "util/log.hpp"

#include <iostream>

namespace e2e {

namespace {
LogLevel g_level = LogLevel::Warn;
std::ostream* g_stream = &std::cerr;
} // namespace

void set_log_level(LogLevel level) { g_level = level; }

void set_log_stream(std::ostream& os) { g_stream = &os; }

void log_info(const std::string& msg) {
    if (g_level >= LogLevel::Info) *g_stream << "[INFO] " << msg << "\n";
}

void log_warn(const std::string& msg) {
    if (g_level >= LogLevel::Warn) *g_stream << "[WARN] " << msg << "\n";
}

void log_error(const std::string& msg) {
    *g_stream << "[ERROR] " << msg << "\n";
}

} // namespace e2e
