#ifndef CLOCK_H
#define CLOCK_H

#include <stdint.h>

// Monotonic milliseconds since boot. 64-bit so it never wraps in service.
class Clock {
    public:
        virtual ~Clock() {}
        virtual uint64_t nowMs() = 0;
};

#endif
