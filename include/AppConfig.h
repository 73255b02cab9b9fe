#ifndef APP_CONFIG_H
#define APP_CONFIG_H

#include <stddef.h>
#include <stdint.h>
#include <vector>

#include "PinTypes.h"

// --- NETWORK ---
#define GPIOLIVE_HTTP_PORT 8081
#define GPIOLIVE_HOSTNAME "gpio-live"
#define GPIOLIVE_WIFI_SSID "Your_WiFi_SSID"         // set me
#define GPIOLIVE_WIFI_PASSWORD "Your_WiFi_Password" // set me
#define GPIOLIVE_WIFI_TIMEOUT_MS 20000

// --- HTTP LIMITS ---
#define GPIOLIVE_MAX_CONNECTIONS 8     // lwIP default leaves ~10 sockets
#define GPIOLIVE_CLIENT_TIMEOUT_MS 5000
#define GPIOLIVE_MAX_REQUEST_BYTES 1024
#define GPIOLIVE_READ_CHUNK 256
#define GPIOLIVE_WRITE_CHUNK 1024
#define GPIOLIVE_STREAM_BACKLOG 2048   // unsent SSE bytes before frames are skipped
#define GPIOLIVE_MAX_JSON_BYTES 8192   // largest JSON document a response may build

// --- SAMPLING ---
#define GPIOLIVE_SAMPLE_INTERVAL_MS 500
#define GPIOLIVE_VREF 3.3f
#define GPIOLIVE_ADC_BITS 12
#define GPIOLIVE_TOUCH_THRESHOLD 40000 // ESP32-S3 counts rise when touched
#define GPIOLIVE_GRADIENT_BUCKETS 8
#define GPIOLIVE_ANALOG_HIGH_VOLTS 2.0f

struct ServerConfig {
    uint16_t port;
    uint8_t maxConnections;
    uint32_t clientTimeoutMs;
    size_t maxRequestBytes;
    size_t readChunkBytes;
    size_t writeChunkBytes;
    size_t maxStreamBacklog;
};

struct SamplerConfig {
    float vref;
    uint16_t adcMaxRaw;
    uint32_t touchThreshold;
    uint8_t gradientBuckets;
};

struct AppSettings {
    ServerConfig server;
    SamplerConfig sampler;
    uint32_t sampleIntervalMs;
    float analogHighVolts;
    size_t maxJsonBytes;
};

// Settings built from the compile-time defaults above.
AppSettings defaultSettings();

// Seeed XIAO ESP32-S3 header: D0-D5, D8-D10 are ADC capable,
// D6/D7 are the UART pins and only read as digital levels.
std::vector<PinDescriptor> defaultPinTable();

#endif
