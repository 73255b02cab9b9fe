#include "AppConfig.h"

AppSettings defaultSettings() {
  AppSettings s;

  s.server.port = GPIOLIVE_HTTP_PORT;
  s.server.maxConnections = GPIOLIVE_MAX_CONNECTIONS;
  s.server.clientTimeoutMs = GPIOLIVE_CLIENT_TIMEOUT_MS;
  s.server.maxRequestBytes = GPIOLIVE_MAX_REQUEST_BYTES;
  s.server.readChunkBytes = GPIOLIVE_READ_CHUNK;
  s.server.writeChunkBytes = GPIOLIVE_WRITE_CHUNK;
  s.server.maxStreamBacklog = GPIOLIVE_STREAM_BACKLOG;

  s.sampler.vref = GPIOLIVE_VREF;
  s.sampler.adcMaxRaw = (1u << GPIOLIVE_ADC_BITS) - 1;
  s.sampler.touchThreshold = GPIOLIVE_TOUCH_THRESHOLD;
  s.sampler.gradientBuckets = GPIOLIVE_GRADIENT_BUCKETS;

  s.sampleIntervalMs = GPIOLIVE_SAMPLE_INTERVAL_MS;
  s.analogHighVolts = GPIOLIVE_ANALOG_HIGH_VOLTS;
  s.maxJsonBytes = GPIOLIVE_MAX_JSON_BYTES;
  return s;
}

static PinDescriptor pin(uint8_t id, uint8_t gpio, PinCapability cap,
                         bool busPin = false) {
  PinDescriptor d;
  d.id = id;
  d.gpio = gpio;
  d.capability = cap;
  d.busPin = busPin;
  d.label = "D" + std::to_string(static_cast<unsigned>(id));
  return d;
}

std::vector<PinDescriptor> defaultPinTable() {
  std::vector<PinDescriptor> pins;
  pins.push_back(pin(0, 1, PinCapability::AnalogIn));
  pins.push_back(pin(1, 2, PinCapability::AnalogIn));
  pins.push_back(pin(2, 3, PinCapability::AnalogIn));
  pins.push_back(pin(3, 4, PinCapability::AnalogIn));
  pins.push_back(pin(4, 5, PinCapability::AnalogIn));
  pins.push_back(pin(5, 6, PinCapability::AnalogIn));
  pins.push_back(pin(6, 43, PinCapability::DigitalIn, true)); // UART TX
  pins.push_back(pin(7, 44, PinCapability::DigitalIn, true)); // UART RX
  pins.push_back(pin(8, 7, PinCapability::AnalogIn));
  pins.push_back(pin(9, 8, PinCapability::AnalogIn));
  pins.push_back(pin(10, 9, PinCapability::AnalogIn));
  return pins;
}
