#ifndef ESP32_HAL_H
#define ESP32_HAL_H

#include <Arduino.h>
#include <WiFi.h>

#include "Clock.h"
#include "NetTransport.h"
#include "PinIo.h"
#include "SystemProbe.h"

// Arduino-ESP32 backends for the hardware interfaces used by the core.

class Esp32PinIo : public PinIo {
    private:
        bool adcConfigured;

    public:
        Esp32PinIo();

        bool configure(const PinDescriptor &pin) override;
        bool readDigital(uint8_t gpio, bool &level) override;
        bool readAnalog(uint8_t gpio, uint16_t &raw) override;
        bool readTouch(uint8_t gpio, uint32_t &raw) override;
};

class Esp32SystemProbe : public SystemProbe {
    public:
        bool heapStats(uint32_t &freeBytes, uint32_t &totalBytes) override;
        bool flashSize(uint32_t &bytes) override;
        bool psramSize(uint32_t &bytes) override;
        bool cpuFreqMhz(uint32_t &mhz) override;
        bool chipModel(std::string &model) override;
        bool cores(uint8_t &count) override;
        void networkInfo(NetworkInfo &out) override;
};

class Esp32Clock : public Clock {
    public:
        uint64_t nowMs() override;
};

// WiFiClient with writes pushed straight to the lwIP socket using
// MSG_DONTWAIT; WiFiClient::write() would retry until everything is sent.
class WiFiNetClient : public NetClient {
    private:
        WiFiClient client;

    public:
        explicit WiFiNetClient(const WiFiClient &client);

        bool connected() override;
        int read(uint8_t *buf, size_t len) override;
        int write(const uint8_t *buf, size_t len) override;
        void stop() override;
        std::string remoteAddress() override;
};

class WiFiNetServer : public NetServer {
    private:
        WiFiServer server;

    public:
        WiFiNetServer();

        bool begin(uint16_t port) override;
        std::unique_ptr<NetClient> accept() override;
};

#endif
