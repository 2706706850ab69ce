/*
 * Serial_Transport Implementation - POSIX termios + poll()
 */

#include "drivers/serial_transport.hpp"
#include "utils/mono_clock.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

static bool baud_to_speed(uint32_t baud, speed_t *out) {
    switch (baud) {
        case 9600U:   *out = B9600;   return true;
        case 19200U:  *out = B19200;  return true;
        case 38400U:  *out = B38400;  return true;
        case 57600U:  *out = B57600;  return true;
        case 115200U: *out = B115200; return true;
        case 230400U: *out = B230400; return true;
        default:      return false;
    }
}

/*============================================================================
 * Lifecycle
 *============================================================================*/

Serial_Transport::~Serial_Transport() {
    deinit();
}

bool Serial_Transport::init(const char *device, uint32_t baud, uint32_t write_timeout_ms) {
    deinit();
    write_timeout_ms_ = write_timeout_ms;

    if (device == nullptr || strcmp(device, "-") == 0) {
        return attach_fd(STDOUT_FILENO, write_timeout_ms);
    }

    if (strlen(device) >= sizeof(device_)) {
        fprintf(stderr, "[SERIAL] Device path too long: %s\n", device);
        return false;
    }
    strncpy(device_, device, sizeof(device_) - 1);
    device_[sizeof(device_) - 1] = '\0';
    baud_ = baud;

    return open_device();
}

bool Serial_Transport::attach_fd(int fd, uint32_t write_timeout_ms) {
    deinit();
    int flags = (fd >= 0) ? fcntl(fd, F_GETFL) : -1;
    if (flags < 0) {
        fprintf(stderr, "[SERIAL] Invalid descriptor %d\n", fd);
        return false;
    }
    /* A blocking write would never reach the poll() bound below */
    if ((flags & O_NONBLOCK) == 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) {
        fprintf(stderr, "[SERIAL] O_NONBLOCK on fd %d failed: %s (%d)\n", fd, strerror(errno), errno);
        return false;
    }
    fd_ = fd;
    owns_fd_ = false;
    borrowed_flags_ = flags;
    is_tty_ = false;
    device_[0] = '\0';
    write_timeout_ms_ = write_timeout_ms;
    consecutive_failures = 0;
    return true;
}

void Serial_Transport::deinit() {
    close_fd();
    device_[0] = '\0';
}

void Serial_Transport::close_fd() {
    if (fd_ >= 0 && owns_fd_) {
        close(fd_);
    } else if (fd_ >= 0 && borrowed_flags_ >= 0) {
        /* Hand a borrowed descriptor back in the mode we found it */
        (void)fcntl(fd_, F_SETFL, borrowed_flags_);
    }
    borrowed_flags_ = -1;
    fd_ = -1;
    owns_fd_ = false;
    is_tty_ = false;
}

/*============================================================================
 * Device Setup
 *============================================================================*/

bool Serial_Transport::open_device() {
    int fd = open(device_, O_WRONLY | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        fprintf(stderr, "[SERIAL] Open %s failed: %s (%d)\n", device_, strerror(errno), errno);
        return false;
    }
    fd_ = fd;
    owns_fd_ = true;
    is_tty_ = (isatty(fd) == 1);

    if (is_tty_ && !configure_tty()) {
        close_fd();
        return false;
    }

    consecutive_failures = 0;
    fprintf(stderr, "[SERIAL] Opened %s%s\n", device_, is_tty_ ? " (tty)" : "");
    return true;
}

bool Serial_Transport::configure_tty() {
    speed_t speed;
    if (!baud_to_speed(baud_, &speed)) {
        fprintf(stderr, "[SERIAL] Unsupported baud %lu\n", static_cast<unsigned long>(baud_));
        return false;
    }

    struct termios tio;
    if (tcgetattr(fd_, &tio) != 0) {
        fprintf(stderr, "[SERIAL] tcgetattr failed: %s (%d)\n", strerror(errno), errno);
        return false;
    }

    cfmakeraw(&tio);
    tio.c_cflag |= (CLOCAL | CREAD);
    tio.c_cflag &= ~(CSTOPB | PARENB);   /* 8N1 */
    cfsetispeed(&tio, speed);
    cfsetospeed(&tio, speed);

    if (tcsetattr(fd_, TCSANOW, &tio) != 0) {
        fprintf(stderr, "[SERIAL] tcsetattr failed: %s (%d)\n", strerror(errno), errno);
        return false;
    }
    return true;
}

/*============================================================================
 * Line Output
 *============================================================================*/

bool Serial_Transport::write_line(const char *line, size_t len) {
    if (fd_ < 0 || line == nullptr || len == 0) {
        if (consecutive_failures < UINT16_MAX) {
            consecutive_failures++;
        }
        return false;
    }

    const uint64_t deadline_us = mono_now_us() + static_cast<uint64_t>(write_timeout_ms_) * 1000U;
    size_t written = 0;

    while (written < len) {
        ssize_t n = write(fd_, line + written, len - written);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            /* EPIPE/EIO/ENXIO: link gone, recovery must reopen */
            fprintf(stderr, "[SERIAL] Write failed: %s (%d)\n", strerror(errno), errno);
            if (owns_fd_) {
                close_fd();
            }
            break;
        }

        uint64_t now_us = mono_now_us();
        if (now_us >= deadline_us) {
            break;
        }
        struct pollfd pfd = {fd_, POLLOUT, 0};
        int wait_ms = static_cast<int>((deadline_us - now_us + 999U) / 1000U);
        int pr = poll(&pfd, 1, wait_ms);
        if (pr < 0 && errno != EINTR) {
            break;
        }
        if (pr == 0) {
            break;   /* Timed out: drop the rest of this line */
        }
        if (pr > 0 && (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
            if (owns_fd_) {
                close_fd();
            }
            break;
        }
    }

    if (written == len) {
        consecutive_failures = 0;
        return true;
    }
    if (consecutive_failures < UINT16_MAX) {
        consecutive_failures++;
    }
    return false;
}

bool Serial_Transport::try_recovery() {
    if (device_[0] == '\0') {
        /* Attached descriptor: nothing to reopen */
        return fd_ >= 0;
    }
    close_fd();
    return open_device();
}
