/*
 * Serial_Transport - Write-line transport over a TTY, pipe, or stdout
 * Non-blocking writes bounded by poll() so a stalled link cannot hold a tick
 */

#ifndef SERIAL_TRANSPORT_HPP
#define SERIAL_TRANSPORT_HPP

#include "config.h"
#include "utils/transport_interface.hpp"

#include <cstddef>
#include <cstdint>

class Serial_Transport final : public Line_Transport {
public:
    Serial_Transport() = default;
    ~Serial_Transport() override;

    /* Disable copy/move */
    Serial_Transport(const Serial_Transport&) = delete;
    Serial_Transport& operator=(const Serial_Transport&) = delete;
    Serial_Transport(Serial_Transport&&) = delete;
    Serial_Transport& operator=(Serial_Transport&&) = delete;

    /**
     * @brief Open a serial device (raw 8N1) and remember it for recovery.
     * "-" attaches stdout instead.
     * @return true if the device is open and configured
     */
    bool init(const char *device, uint32_t baud = TX_SERIAL_BAUD,
              uint32_t write_timeout_ms = TX_WRITE_TIMEOUT_MS);

    /**
     * @brief Use an already-open descriptor (not closed by this object).
     * The descriptor is switched to O_NONBLOCK so writes stay bounded by
     * the write timeout; its original flags are restored by deinit().
     * @return true if fd is valid and could be made non-blocking
     */
    bool attach_fd(int fd, uint32_t write_timeout_ms = TX_WRITE_TIMEOUT_MS);

    /** @brief Close an owned device. Attached descriptors are left open. */
    void deinit();

    bool write_line(const char *line, size_t len) override;
    bool try_recovery() override;
    bool is_open() const override { return fd_ >= 0; }

    uint16_t consecutive_failures = 0;

private:
    static constexpr size_t MAX_DEVICE_PATH = 128;

    bool open_device();
    bool configure_tty();
    void close_fd();

    int fd_ = -1;
    bool owns_fd_ = false;
    int borrowed_flags_ = -1;   /* F_GETFL of an attached fd, -1 if none */
    bool is_tty_ = false;
    uint32_t baud_ = TX_SERIAL_BAUD;
    uint32_t write_timeout_ms_ = TX_WRITE_TIMEOUT_MS;
    char device_[MAX_DEVICE_PATH] = {};
};

#endif // SERIAL_TRANSPORT_HPP
