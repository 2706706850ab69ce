/*
 * Stdio_Reporter - fprintf-based status output
 * Writes to stderr by default so stdout can carry the frame stream
 */

#ifndef STDIO_REPORTER_HPP
#define STDIO_REPORTER_HPP

#include "status_reporter.hpp"

#include <cstdio>
#include <mutex>

class Stdio_Reporter final : public Status_Reporter {
public:
    explicit Stdio_Reporter(FILE *out = stderr) : out_(out) {}

    void show_status(const char *tag, const char *msg) override;
    void show_error(const char *tag, const char *msg, StatusSeverity sev) override;

private:
    FILE *out_;
    std::mutex mutex_;   /* Tick and reader threads both report */
};

#endif // STDIO_REPORTER_HPP
