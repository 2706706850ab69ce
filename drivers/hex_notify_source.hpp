/*
 * Hex_Notify_Source - Sensor notifications from a text hex dump
 * Reader thread: one packet per line from a descriptor (stdin by default),
 * decoded as LEGO Mario IMU notifications
 */

#ifndef HEX_NOTIFY_SOURCE_HPP
#define HEX_NOTIFY_SOURCE_HPP

#include "config.h"
#include "utils/transport_interface.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <thread>

struct SourceStats {
    uint32_t lines;          /* Complete lines read */
    uint32_t imu_samples;    /* Delivered to the callback */
    uint32_t other_packets;  /* Valid hex, not an IMU notification */
    uint32_t malformed;      /* Unparseable or overlong lines */
    bool eof;                /* Input closed */
};

class Hex_Notify_Source final : public Sample_Source {
public:
    explicit Hex_Notify_Source(int fd);
    ~Hex_Notify_Source() override;

    Hex_Notify_Source(const Hex_Notify_Source&) = delete;
    Hex_Notify_Source& operator=(const Hex_Notify_Source&) = delete;

    bool start(SampleCallback on_sample) override;
    void stop() override;
    bool running() const override { return running_.load(); }

    SourceStats get_stats() const;

private:
    void run();
    void handle_line(const char *line);

    int fd_;
    SampleCallback on_sample_;
    std::thread thread_;
    std::atomic_bool running_{false};
    std::atomic_bool eof_{false};

    std::atomic<uint32_t> lines_{0};
    std::atomic<uint32_t> imu_samples_{0};
    std::atomic<uint32_t> other_packets_{0};
    std::atomic<uint32_t> malformed_{0};

    /* Reader-thread only */
    char line_[SRC_MAX_LINE_LEN] = {};
    size_t line_len_ = 0;
    bool discarding_ = false;   /* Inside an overlong line */
};

#endif // HEX_NOTIFY_SOURCE_HPP
