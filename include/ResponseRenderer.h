#ifndef RESPONSE_RENDERER_H
#define RESPONSE_RENDERER_H

#include <string>

#include "AppConfig.h"
#include "HttpServer.h"
#include "PinTypes.h"

// Turns a Snapshot / DiagnosticsSnapshot into response bodies. Holds only
// calibration constants, so the output depends on the arguments alone.
// Every render call returns false if the document could not be built.
class ResponseRenderer {
    private:
        float vref;
        uint8_t gradientBuckets;
        float analogHighVolts;
        size_t maxJsonBytes;

        bool fitsBudget(size_t capacity, const char *what) const;
        void appendPinCard(const PinReading &r, std::string &out) const;

    public:
        // Documents that would need more than maxJsonBytes of pool are not
        // built; the render call fails instead.
        ResponseRenderer(const SamplerConfig &sampler, float analogHighVolts,
                         size_t maxJsonBytes = GPIOLIVE_MAX_JSON_BYTES);

        bool render(Route route, const Snapshot &snap,
                    const DiagnosticsSnapshot &diag, std::string &out) const;

        // {"timestamp":..,"generation":..,"pins":{"D0":{"state":..,"value":..}}}
        bool renderStatusJson(const Snapshot &snap, std::string &out) const;
        bool renderInfoJson(const DiagnosticsSnapshot &diag,
                            std::string &out) const;
        bool renderDashboard(const Snapshot &snap,
                             const DiagnosticsSnapshot &diag,
                             std::string &out) const;

        // One server-sent event frame carrying the status JSON
        bool renderEvent(const Snapshot &snap, std::string &out) const;

        // CSS colour of a pin: green/red/blue/grey, or an HSL gradient
        // step for analog readings. Bus pins are always grey.
        std::string pinColor(const PinReading &r) const;

        // Dot class: "lo", "hi", "touch" or "err", and "na" for bus pins.
        // Analog pins at or above analogHighVolts count as "hi".
        const char *pinClass(const PinReading &r) const;
};

const char *contentTypeFor(Route route);

#endif
