#include "PinSampler.h"

#include <math.h>
#include <new>
#include <set>

#include "Log.h"

static const char *TAG = "PINS";

PinSampler::PinSampler(PinIo &io, const std::vector<PinDescriptor> &pins,
                       const SamplerConfig &config)
    : io(io), descriptors(pins), config(config),
      failing(pins.size(), false), readFailures(0) {}

bool PinSampler::begin() {
  if (descriptors.empty()) {
    logError(TAG, "No pins configured");
    return false;
  }

  std::set<std::string> labels;
  for (size_t i = 0; i < descriptors.size(); i++) {
    const PinDescriptor &pin = descriptors[i];
    if (pin.label.empty()) {
      logError(TAG, "Pin #%u has an empty label", (unsigned)pin.id);
      return false;
    }
    if (!labels.insert(pin.label).second) {
      logError(TAG, "Duplicate pin label %s", pin.label.c_str());
      return false;
    }
  }

  for (size_t i = 0; i < descriptors.size(); i++) {
    const PinDescriptor &pin = descriptors[i];
    // A pin that fails setup is still sampled; its reads report ERROR
    if (!io.configure(pin)) {
      logWarn(TAG, "%s (GPIO %u) could not be configured",
              pin.label.c_str(), (unsigned)pin.gpio);
    }
  }

  logInfo(TAG, "Monitoring %u pins", (unsigned)descriptors.size());
  return true;
}

PinReading PinSampler::readOne(size_t index) {
  const PinDescriptor &pin = descriptors[index];

  PinReading reading;
  reading.id = pin.id;
  reading.label = pin.label;
  reading.capability = pin.capability;
  reading.busPin = pin.busPin;

  bool ok = false;
  switch (pin.capability) {
  case PinCapability::DigitalIn: {
    bool level = false;
    ok = io.readDigital(pin.gpio, level);
    if (ok) {
      reading.state = classifyDigital(level);
      reading.kind = PinReading::Level;
      reading.level = level;
    }
    break;
  }
  case PinCapability::TouchIn: {
    uint32_t raw = 0;
    ok = io.readTouch(pin.gpio, raw);
    if (ok) {
      reading.state = classifyTouch(raw, config.touchThreshold);
      reading.kind = PinReading::Count;
      reading.raw = raw;
    }
    break;
  }
  case PinCapability::AnalogIn: {
    uint16_t raw = 0;
    ok = io.readAnalog(pin.gpio, raw);
    if (ok) {
      reading.state = PinState::Analog;
      reading.kind = PinReading::Volts;
      reading.raw = raw;
      reading.volts = rawToVolts(raw, config.adcMaxRaw, config.vref);
      reading.bucket =
          voltageBucket(reading.volts, config.vref, config.gradientBuckets);
    }
    break;
  }
  }

  if (!ok) {
    reading.state = PinState::Error;
    reading.kind = PinReading::NoValue;
    readFailures++;
    if (!failing[index]) {
      logWarn(TAG, "Read failed on %s (GPIO %u)", pin.label.c_str(),
              (unsigned)pin.gpio);
    }
  } else if (failing[index]) {
    logInfo(TAG, "%s recovered", pin.label.c_str());
  }
  failing[index] = !ok;

  return reading;
}

std::shared_ptr<Snapshot> PinSampler::sample(uint64_t nowMs) {
  try {
    std::shared_ptr<Snapshot> snap(new (std::nothrow) Snapshot());
    if (!snap) {
      return snap;
    }
    snap->timestampMs = nowMs;
    snap->readings.reserve(descriptors.size());

    for (size_t i = 0; i < descriptors.size(); i++) {
      snap->readings.push_back(readOne(i));
    }
    return snap;
  } catch (const std::bad_alloc &) {
    logError(TAG, "Out of memory building snapshot");
    return std::shared_ptr<Snapshot>();
  }
}

const std::vector<PinDescriptor> &PinSampler::getDescriptors() const {
  return descriptors;
}

uint32_t PinSampler::getReadFailures() const { return readFailures; }

// --- Classification helpers ---

PinState classifyDigital(bool level) {
  return level ? PinState::High : PinState::Low;
}

PinState classifyTouch(uint32_t raw, uint32_t threshold) {
  return raw > threshold ? PinState::Touch : PinState::Low;
}

float rawToVolts(uint16_t raw, uint16_t adcMaxRaw, float vref) {
  if (adcMaxRaw == 0) {
    return 0.0f;
  }
  if (raw > adcMaxRaw) {
    raw = adcMaxRaw;
  }
  float volts = (static_cast<float>(raw) / adcMaxRaw) * vref;
  return roundf(volts * 1000.0f) / 1000.0f; // mV resolution
}

uint8_t voltageBucket(float volts, float vref, uint8_t buckets) {
  if (buckets <= 1 || vref <= 0.0f || volts <= 0.0f) {
    return 0;
  }
  float t = volts / vref;
  if (t >= 1.0f) {
    return buckets - 1;
  }
  return static_cast<uint8_t>(t * buckets);
}

const char *pinStateName(PinState state) {
  switch (state) {
  case PinState::Low:
    return "LOW";
  case PinState::High:
    return "HIGH";
  case PinState::Touch:
    return "TOUCH";
  case PinState::Analog:
    return "ANALOG";
  default:
    return "ERROR";
  }
}
