#include "ResponseRenderer.h"

#include <math.h>
#include <stdio.h>
#include <string.h>
#include <ArduinoJson.h>

#include "DashboardPage.h"
#include "Log.h"

static const char *TAG = "RENDER";

#define COLOR_LOW "#2e9e5f"
#define COLOR_HIGH "#d94134"
#define COLOR_TOUCH "#3b82f6"
#define COLOR_ERROR "#bdbdbd"
#define COLOR_NA "#bdbdbd" // bus pins (UART), level not meaningful

// Bytes per pin card in the dashboard, used to size the output up front
#define CARD_ESTIMATE 200

static double roundMilli(float v) {
  return floor(static_cast<double>(v) * 1000.0 + 0.5) / 1000.0;
}

static std::string htmlEscape(const std::string &in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); i++) {
    switch (in[i]) {
    case '&': out += "&amp;"; break;
    case '<': out += "&lt;"; break;
    case '>': out += "&gt;"; break;
    case '"': out += "&quot;"; break;
    case '\'': out += "&#39;"; break;
    default: out += in[i];
    }
  }
  return out;
}

const char *contentTypeFor(Route route) {
  switch (route) {
  case Route::Dashboard:
    return "text/html; charset=utf-8";
  case Route::Status:
  case Route::Info:
    return "application/json";
  case Route::Events:
    return "text/event-stream";
  default:
    return "text/plain";
  }
}

ResponseRenderer::ResponseRenderer(const SamplerConfig &sampler,
                                   float analogHighVolts, size_t maxJsonBytes)
    : vref(sampler.vref), gradientBuckets(sampler.gradientBuckets),
      analogHighVolts(analogHighVolts), maxJsonBytes(maxJsonBytes) {}

bool ResponseRenderer::fitsBudget(size_t capacity, const char *what) const {
  if (capacity > maxJsonBytes) {
    logWarn(TAG, "%s needs %lu bytes, limit is %lu", what,
            (unsigned long)capacity, (unsigned long)maxJsonBytes);
    return false;
  }
  return true;
}

bool ResponseRenderer::render(Route route, const Snapshot &snap,
                              const DiagnosticsSnapshot &diag,
                              std::string &out) const {
  switch (route) {
  case Route::Dashboard:
    return renderDashboard(snap, diag, out);
  case Route::Status:
    return renderStatusJson(snap, out);
  case Route::Info:
    return renderInfoJson(diag, out);
  case Route::Events:
    return renderEvent(snap, out);
  default:
    return false;
  }
}

bool ResponseRenderer::renderStatusJson(const Snapshot &snap,
                                        std::string &out) const {
  const size_t n = snap.readings.size();

  // Linear in the pin count: one object per pin plus copied labels
  size_t capacity =
      JSON_OBJECT_SIZE(3) + JSON_OBJECT_SIZE(n) + n * JSON_OBJECT_SIZE(2);
  for (size_t i = 0; i < n; i++) {
    capacity += snap.readings[i].label.size() + 1;
  }
  if (!fitsBudget(capacity, "status")) {
    return false;
  }

  DynamicJsonDocument doc(capacity);
  if (doc.capacity() == 0) {
    return false;
  }

  doc["timestamp"] = snap.timestampMs;
  doc["generation"] = snap.generation;
  JsonObject pins = doc.createNestedObject("pins");

  for (size_t i = 0; i < n; i++) {
    const PinReading &r = snap.readings[i];
    JsonObject pin = pins.createNestedObject(r.label);
    pin["state"] = pinStateName(r.state);
    switch (r.kind) {
    case PinReading::Level:
      pin["value"] = r.level ? 1 : 0;
      break;
    case PinReading::Count:
      pin["value"] = r.raw;
      break;
    case PinReading::Volts:
      pin["value"] = roundMilli(r.volts);
      break;
    default:
      pin["value"] = static_cast<const char *>(0); // null
      break;
    }
  }

  if (doc.overflowed()) {
    return false;
  }
  out.clear();
  serializeJson(doc, out);
  return true;
}

bool ResponseRenderer::renderInfoJson(const DiagnosticsSnapshot &diag,
                                      std::string &out) const {
  size_t capacity = JSON_OBJECT_SIZE(20) + diag.ip.size() + diag.ssid.size() +
                    diag.mac.size() + diag.gateway.size() + diag.dns.size() +
                    diag.chipModel.size() + diag.firmwareVersion.size() +
                    diag.build.size() + 8;
  if (!fitsBudget(capacity, "info")) {
    return false;
  }
  DynamicJsonDocument doc(capacity);
  if (doc.capacity() == 0) {
    return false;
  }

  doc["uptime"] = diag.uptimeSeconds;
  doc["heap_free"] = diag.heapFree;
  doc["heap_total"] = diag.heapTotal;
  doc["flash_size"] = diag.flashSize;
  if (diag.hasPsram) {
    doc["psram"] = diag.psramSize;
  } else {
    doc["psram"] = static_cast<const char *>(0);
  }
  doc["ip"] = diag.ip;
  doc["ssid"] = diag.ssid;
  doc["rssi"] = diag.rssi;
  doc["mac"] = diag.mac;
  doc["gateway"] = diag.gateway;
  doc["dns"] = diag.dns;
  doc["chip_model"] = diag.chipModel;
  doc["cores"] = diag.cores;
  doc["cpu_freq_mhz"] = diag.cpuFreqMhz;
  doc["firmware_version"] = diag.firmwareVersion;
  doc["build"] = diag.build;
  doc["network_up"] = diag.networkUp;
  doc["sample_interval_ms"] = diag.sampleIntervalMs;
  doc["clients"] = diag.clients;

  if (doc.overflowed()) {
    return false;
  }
  out.clear();
  serializeJson(doc, out);
  return true;
}

bool ResponseRenderer::renderEvent(const Snapshot &snap,
                                   std::string &out) const {
  std::string json;
  if (!renderStatusJson(snap, json)) {
    return false;
  }
  char id[24];
  snprintf(id, sizeof(id), "id: %lu\n", (unsigned long)snap.generation);
  out = id;
  out += "data: ";
  out += json;
  out += "\n\n";
  return true;
}

std::string ResponseRenderer::pinColor(const PinReading &r) const {
  if (r.busPin) {
    return COLOR_NA;
  }
  switch (r.state) {
  case PinState::Low:
    return COLOR_LOW;
  case PinState::High:
    return COLOR_HIGH;
  case PinState::Touch:
    return COLOR_TOUCH;
  case PinState::Analog: {
    // green (120) -> red (0), brighter as the voltage rises
    float t = gradientBuckets > 1
                  ? static_cast<float>(r.bucket) / (gradientBuckets - 1)
                  : 0.0f;
    if (t > 1.0f) {
      t = 1.0f;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "hsl(%d,90%%,%d%%)",
             static_cast<int>(lroundf(120.0f * (1.0f - t))),
             static_cast<int>(lroundf(35.0f + 30.0f * t)));
    return buf;
  }
  default:
    return COLOR_ERROR;
  }
}

const char *ResponseRenderer::pinClass(const PinReading &r) const {
  if (r.busPin) {
    return "na";
  }
  switch (r.state) {
  case PinState::Low:
    return "lo";
  case PinState::High:
    return "hi";
  case PinState::Touch:
    return "touch";
  case PinState::Analog:
    return r.volts >= analogHighVolts ? "hi" : "lo";
  default:
    return "err";
  }
}

void ResponseRenderer::appendPinCard(const PinReading &r,
                                     std::string &out) const {
  const char *cap = "digital";
  if (r.capability == PinCapability::AnalogIn) {
    cap = "analog";
  } else if (r.capability == PinCapability::TouchIn) {
    cap = "touch";
  }

  char value[24];
  if (r.busPin) {
    snprintf(value, sizeof(value), "UART");
  } else if (r.kind == PinReading::Level) {
    snprintf(value, sizeof(value), "%s", r.level ? "HIGH" : "LOW");
  } else if (r.kind == PinReading::Count) {
    snprintf(value, sizeof(value), "%lu", (unsigned long)r.raw);
  } else if (r.kind == PinReading::Volts) {
    snprintf(value, sizeof(value), "%.2f V", static_cast<double>(r.volts));
  } else {
    snprintf(value, sizeof(value), "ERR");
  }

  std::string label = htmlEscape(r.label);
  out += "<div class=\"pin\" id=\"pin-";
  out += label;
  out += "\" data-cap=\"";
  out += cap;
  out += "\" data-state=\"";
  out += pinStateName(r.state);
  if (r.busPin) {
    out += "\" data-na=\"1";
  }
  out += "\"><div class=\"dot ";
  out += pinClass(r);
  out += "\" style=\"background:";
  out += pinColor(r);
  out += "\"></div><div class=\"lbl\">";
  out += label;
  out += "</div><div class=\"val\">";
  out += value;
  out += "</div></div>\n";
}

bool ResponseRenderer::renderDashboard(const Snapshot &snap,
                                       const DiagnosticsSnapshot &diag,
                                       std::string &out) const {
  const char *tpl = DASHBOARD_TEMPLATE;
  const size_t tplLen = strlen(tpl);

  out.clear();
  out.reserve(tplLen + snap.readings.size() * CARD_ESTIMATE);

  char num[32];
  size_t pos = 0;
  while (pos < tplLen) {
    const char *open = strstr(tpl + pos, "{{");
    if (open == nullptr) {
      out.append(tpl + pos, tplLen - pos);
      break;
    }
    const char *close = strstr(open + 2, "}}");
    if (close == nullptr) {
      out.append(tpl + pos, tplLen - pos);
      break;
    }

    out.append(tpl + pos, open - (tpl + pos));
    std::string key(open + 2, close - open - 2);
    pos = (close + 2) - tpl;

    if (key == "PIN_CARDS") {
      for (size_t i = 0; i < snap.readings.size(); i++) {
        appendPinCard(snap.readings[i], out);
      }
    } else if (key == "TITLE") {
      out += "GPIO Live";
    } else if (key == "FIRMWARE") {
      out += htmlEscape(diag.firmwareVersion);
    } else if (key == "IP") {
      out += htmlEscape(diag.ip);
    } else if (key == "GENERATION") {
      snprintf(num, sizeof(num), "%lu", (unsigned long)snap.generation);
      out += num;
    } else if (key == "TIMESTAMP") {
      snprintf(num, sizeof(num), "%llu", (unsigned long long)snap.timestampMs);
      out += num;
    } else if (key == "PIN_COUNT") {
      snprintf(num, sizeof(num), "%u", (unsigned)snap.readings.size());
      out += num;
    } else if (key == "VREF") {
      snprintf(num, sizeof(num), "%.3f", static_cast<double>(vref));
      out += num;
    } else if (key == "BUCKETS") {
      snprintf(num, sizeof(num), "%u", (unsigned)gradientBuckets);
      out += num;
    } else if (key == "ANALOG_HIGH") {
      snprintf(num, sizeof(num), "%.3f", static_cast<double>(analogHighVolts));
      out += num;
    } else {
      // Unknown placeholder: leave it visible
      out.append(open, (close + 2) - open);
    }
  }
  return true;
}
