#ifndef PIN_SAMPLER_H
#define PIN_SAMPLER_H

#include <memory>
#include <vector>

#include "AppConfig.h"
#include "PinIo.h"
#include "PinTypes.h"

class PinSampler {
    private:
        PinIo &io;
        std::vector<PinDescriptor> descriptors; // fixed after begin()
        SamplerConfig config;

        // One flag per descriptor so a dead pin logs once, not every tick
        std::vector<bool> failing;
        uint32_t readFailures;

        PinReading readOne(size_t index);

    public:
        // Constructor: takes the pin table produced by configuration load
        PinSampler(PinIo &io, const std::vector<PinDescriptor> &pins,
                   const SamplerConfig &config);

        // Validate the table (non-empty, unique non-empty labels) and
        // configure every pin. Returns false if the table is unusable.
        bool begin();

        // One pass over all pins, in table order. Never returns a partial
        // snapshot: a pin that fails to read is reported as ERROR.
        // Returns nullptr if the snapshot cannot be allocated in full.
        std::shared_ptr<Snapshot> sample(uint64_t nowMs);

        const std::vector<PinDescriptor> &getDescriptors() const;
        uint32_t getReadFailures() const;
};

// --- Classification helpers (shared with the renderer and tests) ---
PinState classifyDigital(bool level);
PinState classifyTouch(uint32_t raw, uint32_t threshold);
float rawToVolts(uint16_t raw, uint16_t adcMaxRaw, float vref);
uint8_t voltageBucket(float volts, float vref, uint8_t buckets);

#endif
