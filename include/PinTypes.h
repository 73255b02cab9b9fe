#ifndef PIN_TYPES_H
#define PIN_TYPES_H

#include <stdint.h>
#include <string>
#include <vector>

enum class PinCapability : uint8_t { DigitalIn, AnalogIn, TouchIn };

enum class PinState : uint8_t { Low, High, Touch, Analog, Error };

struct PinDescriptor {
    uint8_t id;   // logical pin number (D0 = 0)
    uint8_t gpio; // physical GPIO behind the logical pin
    PinCapability capability;
    std::string label;
    bool busPin;  // claimed by a peripheral (UART); drawn as not applicable

    PinDescriptor()
        : id(0), gpio(0), capability(PinCapability::DigitalIn), busPin(false) {}
};

// One classified sample. Built once per tick and never modified afterwards.
struct PinReading {
    enum ValueKind : uint8_t { NoValue, Level, Count, Volts };

    uint8_t id;
    std::string label;
    PinCapability capability;
    PinState state;

    ValueKind kind;
    bool level;
    uint32_t raw;   // ADC or touch count
    float volts;
    uint8_t bucket; // colour gradient bucket, analog only
    bool busPin;

    PinReading()
        : id(0), capability(PinCapability::DigitalIn), state(PinState::Error),
          kind(NoValue), level(false), raw(0), volts(0.0f), bucket(0),
          busPin(false) {}

    bool hasValue() const { return kind != NoValue; }

    // Value as it appears in JSON: 0/1, raw count or volts.
    double numericValue() const {
        switch (kind) {
        case Level:
            return level ? 1.0 : 0.0;
        case Count:
            return static_cast<double>(raw);
        case Volts:
            return static_cast<double>(volts);
        default:
            return 0.0;
        }
    }
};

struct Snapshot {
    uint32_t generation;
    uint64_t timestampMs;
    std::vector<PinReading> readings;

    Snapshot() : generation(0), timestampMs(0) {}
};

struct DiagnosticsSnapshot {
    uint64_t uptimeSeconds;
    uint32_t heapFree;
    uint32_t heapTotal;
    uint32_t flashSize;
    bool hasPsram;
    uint32_t psramSize;
    uint32_t cpuFreqMhz;
    std::string chipModel;
    uint8_t cores;

    bool networkUp;
    std::string ip;
    std::string ssid;
    int32_t rssi;
    std::string mac;
    std::string gateway;
    std::string dns;

    std::string firmwareVersion;
    std::string build;

    uint32_t sampleIntervalMs;
    uint32_t clients;

    DiagnosticsSnapshot()
        : uptimeSeconds(0), heapFree(0), heapTotal(0), flashSize(0),
          hasPsram(false), psramSize(0), cpuFreqMhz(0), cores(0),
          networkUp(false), rssi(0), sampleIntervalMs(0), clients(0) {}
};

const char *pinStateName(PinState state);

#endif
