/*
 * Status_Reporter - Abstract operator-facing status output
 * Decouples calibration and emission logic from where diagnostics go
 */

#ifndef STATUS_REPORTER_HPP
#define STATUS_REPORTER_HPP

#include <cstdint>

enum class StatusSeverity : uint8_t { Info, Warning, Error, Fatal };

class Status_Reporter {
public:
    virtual ~Status_Reporter() = default;
    virtual void show_status(const char *tag, const char *msg) = 0;
    virtual void show_error(const char *tag, const char *msg, StatusSeverity sev) = 0;
};

#endif // STATUS_REPORTER_HPP
