#ifndef SYSTEM_PROBE_H
#define SYSTEM_PROBE_H

#include <stdint.h>
#include <string>

struct NetworkInfo {
    bool associated;
    std::string ip;
    std::string ssid;
    int32_t rssi;
    std::string mac;
    std::string gateway;
    std::string dns;

    NetworkInfo() : associated(false), rssi(0) {}
};

// Runtime counters of the chip. Each getter returns false when the
// metric is not available on this board or right now.
class SystemProbe {
    public:
        virtual ~SystemProbe() {}

        virtual bool heapStats(uint32_t &freeBytes, uint32_t &totalBytes) = 0;
        virtual bool flashSize(uint32_t &bytes) = 0;
        virtual bool psramSize(uint32_t &bytes) = 0;
        virtual bool cpuFreqMhz(uint32_t &mhz) = 0;
        virtual bool chipModel(std::string &model) = 0;
        virtual bool cores(uint8_t &count) = 0;

        // Fills whatever is known. associated is false while Wi-Fi is down;
        // the MAC may still be valid in that case.
        virtual void networkInfo(NetworkInfo &out) = 0;
};

#endif
