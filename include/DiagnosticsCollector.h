#ifndef DIAGNOSTICS_COLLECTOR_H
#define DIAGNOSTICS_COLLECTOR_H

#include "Clock.h"
#include "PinTypes.h"
#include "SystemProbe.h"

#define DIAG_NO_ADDRESS "0.0.0.0"
#define DIAG_NO_MAC "00:00:00:00:00:00"
#define DIAG_UNKNOWN "unknown"

class DiagnosticsCollector {
    private:
        SystemProbe &probe;
        Clock &clock;
        uint64_t startMs;

    public:
        DiagnosticsCollector(SystemProbe &probe, Clock &clock);

        // Records the uptime reference
        void begin();

        // Reads every metric now. A metric that can't be read gets its
        // sentinel instead of failing the whole collection.
        DiagnosticsSnapshot collect();
};

#endif
