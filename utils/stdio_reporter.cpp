/*
 * Stdio_Reporter Implementation
 */

#include "utils/stdio_reporter.hpp"

static const char *severity_label(StatusSeverity sev) {
    switch (sev) {
        case StatusSeverity::Info:    return "INFO";
        case StatusSeverity::Warning: return "WARN";
        case StatusSeverity::Error:   return "ERROR";
        case StatusSeverity::Fatal:   return "FATAL";
    }
    return "UNKNOWN";
}

void Stdio_Reporter::show_status(const char *tag, const char *msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    fprintf(out_, "[INFO]  %s: %s\n", tag, msg);
    fflush(out_);
}

void Stdio_Reporter::show_error(const char *tag, const char *msg, StatusSeverity sev) {
    std::lock_guard<std::mutex> lock(mutex_);
    fprintf(out_, "[%s] %s: %s\n", severity_label(sev), tag, msg);
    fflush(out_);
}
