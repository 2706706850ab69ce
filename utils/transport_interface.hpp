/*
 * Transport Interfaces - Sensor notify side and actuator write-line side
 * The bridge borrows both; neither is owned by the core logic
 */

#ifndef TRANSPORT_INTERFACE_HPP
#define TRANSPORT_INTERFACE_HPP

#include "types.h"

#include <cstddef>
#include <functional>

/* Actuator side: accepts one complete text line per call */
class Line_Transport {
public:
    virtual ~Line_Transport() = default;

    /* Must return within the transport's write timeout; false = line lost */
    virtual bool write_line(const char *line, size_t len) = 0;

    /* Attempt to reopen after failures. true if the link is usable again. */
    virtual bool try_recovery() = 0;

    virtual bool is_open() const = 0;
};

using SampleCallback = std::function<void(const RawSample &)>;

/* Sensor side: delivers decoded samples on its own thread */
class Sample_Source {
public:
    virtual ~Sample_Source() = default;
    virtual bool start(SampleCallback on_sample) = 0;
    virtual void stop() = 0;
    virtual bool running() const = 0;
};

#endif // TRANSPORT_INTERFACE_HPP
