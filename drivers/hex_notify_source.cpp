/*
 * Hex_Notify_Source Implementation
 */

#include "drivers/hex_notify_source.hpp"
#include "logic/mario_packet.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <poll.h>
#include <unistd.h>

Hex_Notify_Source::Hex_Notify_Source(int fd) : fd_(fd) {}

Hex_Notify_Source::~Hex_Notify_Source() {
    stop();
}

bool Hex_Notify_Source::start(SampleCallback on_sample) {
    if (running_.load() || !on_sample || fd_ < 0) {
        return false;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    on_sample_ = std::move(on_sample);
    line_len_ = 0;
    discarding_ = false;
    eof_.store(false);
    running_.store(true);
    thread_ = std::thread(&Hex_Notify_Source::run, this);
    return true;
}

void Hex_Notify_Source::stop() {
    running_.store(false);
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

SourceStats Hex_Notify_Source::get_stats() const {
    SourceStats s = {};
    s.lines = lines_.load();
    s.imu_samples = imu_samples_.load();
    s.other_packets = other_packets_.load();
    s.malformed = malformed_.load();
    s.eof = eof_.load();
    return s;
}

void Hex_Notify_Source::handle_line(const char *line) {
    lines_++;

    uint8_t packet[SRC_MAX_PACKET_LEN];
    size_t len = hex_parse_packet(line, packet, sizeof(packet));
    if (len == 0) {
        /* Blank lines are not an error */
        bool blank = true;
        for (const char *p = line; *p != '\0'; ++p) {
            if (*p != ' ' && *p != '\t' && *p != '\r') {
                blank = false;
                break;
            }
        }
        if (!blank) {
            malformed_++;
        }
        return;
    }

    RawSample sample;
    if (!mario_decode_imu(packet, len, &sample)) {
        other_packets_++;
        return;
    }
    imu_samples_++;
    on_sample_(sample);
}

void Hex_Notify_Source::run() {
    char chunk[SRC_MAX_LINE_LEN];

    while (running_.load()) {
        struct pollfd pfd = {fd_, POLLIN, 0};
        int pr = poll(&pfd, 1, static_cast<int>(SRC_POLL_TIMEOUT_MS));
        if (pr < 0) {
            if (errno == EINTR) {
                continue;
            }
            fprintf(stderr, "[SRC] poll failed: %s (%d)\n", strerror(errno), errno);
            break;
        }
        if (pr == 0) {
            continue;   /* Timeout: re-check running_ */
        }

        ssize_t n = read(fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            fprintf(stderr, "[SRC] read failed: %s (%d)\n", strerror(errno), errno);
            break;
        }
        if (n == 0) {
            /* EOF: deliver a final unterminated line, then stop */
            if (line_len_ > 0 && !discarding_) {
                line_[line_len_] = '\0';
                handle_line(line_);
            }
            line_len_ = 0;
            eof_.store(true);
            break;
        }

        for (ssize_t i = 0; i < n; ++i) {
            char c = chunk[i];
            if (c == '\n') {
                if (discarding_) {
                    discarding_ = false;
                } else {
                    line_[line_len_] = '\0';
                    handle_line(line_);
                }
                line_len_ = 0;
                continue;
            }
            if (discarding_) {
                continue;
            }
            if (line_len_ + 1U >= sizeof(line_)) {
                malformed_++;
                discarding_ = true;
                line_len_ = 0;
                continue;
            }
            line_[line_len_++] = c;
        }
    }

    running_.store(false);
}
