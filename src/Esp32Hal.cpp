#include "Esp32Hal.h"

#include <errno.h>
#include <new>
#include <driver/gpio.h>
#include <esp_timer.h>
#include <lwip/sockets.h>

#include "AppConfig.h"

// --- PINS ---

Esp32PinIo::Esp32PinIo() : adcConfigured(false) {}

bool Esp32PinIo::configure(const PinDescriptor &pin) {
  if (!GPIO_IS_VALID_GPIO(pin.gpio)) {
    return false;
  }

  switch (pin.capability) {
  case PinCapability::DigitalIn:
    // Pull-down so a floating pin reads LOW instead of noise
    pinMode(pin.gpio, INPUT_PULLDOWN);
    return true;

  case PinCapability::AnalogIn:
    if (digitalPinToAnalogChannel(pin.gpio) < 0) {
      return false;
    }
    if (!adcConfigured) {
      analogReadResolution(GPIOLIVE_ADC_BITS);
      adcConfigured = true;
    }
    pinMode(pin.gpio, INPUT);
    analogSetPinAttenuation(pin.gpio, ADC_11db); // ~0-3.1 V full scale
    return true;

  case PinCapability::TouchIn:
    return digitalPinToTouchChannel(pin.gpio) >= 0;
  }
  return false;
}

bool Esp32PinIo::readDigital(uint8_t gpio, bool &level) {
  if (!GPIO_IS_VALID_GPIO(gpio)) {
    return false;
  }
  level = (digitalRead(gpio) == HIGH);
  return true;
}

bool Esp32PinIo::readAnalog(uint8_t gpio, uint16_t &raw) {
  if (digitalPinToAnalogChannel(gpio) < 0) {
    return false;
  }
  int value = analogRead(gpio);
  if (value < 0) {
    return false;
  }
  raw = static_cast<uint16_t>(value);
  return true;
}

bool Esp32PinIo::readTouch(uint8_t gpio, uint32_t &raw) {
  if (digitalPinToTouchChannel(gpio) < 0) {
    return false;
  }
  raw = static_cast<uint32_t>(touchRead(gpio));
  return true;
}

// --- SYSTEM ---

bool Esp32SystemProbe::heapStats(uint32_t &freeBytes, uint32_t &totalBytes) {
  freeBytes = ESP.getFreeHeap();
  totalBytes = ESP.getHeapSize();
  return totalBytes > 0;
}

bool Esp32SystemProbe::flashSize(uint32_t &bytes) {
  bytes = ESP.getFlashChipSize();
  return bytes > 0;
}

bool Esp32SystemProbe::psramSize(uint32_t &bytes) {
  if (!psramFound()) {
    return false;
  }
  bytes = ESP.getPsramSize();
  return true;
}

bool Esp32SystemProbe::cpuFreqMhz(uint32_t &mhz) {
  mhz = getCpuFrequencyMhz();
  return mhz > 0;
}

bool Esp32SystemProbe::chipModel(std::string &model) {
  const char *name = ESP.getChipModel();
  if (name == nullptr) {
    return false;
  }
  model = name;
  return true;
}

bool Esp32SystemProbe::cores(uint8_t &count) {
  count = ESP.getChipCores();
  return count > 0;
}

void Esp32SystemProbe::networkInfo(NetworkInfo &out) {
  out.mac = WiFi.macAddress().c_str();
  out.associated = (WiFi.status() == WL_CONNECTED);
  if (!out.associated) {
    return;
  }
  out.ip = WiFi.localIP().toString().c_str();
  out.ssid = WiFi.SSID().c_str();
  out.rssi = WiFi.RSSI();
  out.gateway = WiFi.gatewayIP().toString().c_str();
  out.dns = WiFi.dnsIP().toString().c_str();
}

uint64_t Esp32Clock::nowMs() {
  return static_cast<uint64_t>(esp_timer_get_time()) / 1000ULL;
}

// --- NETWORK ---

WiFiNetClient::WiFiNetClient(const WiFiClient &client) : client(client) {}

bool WiFiNetClient::connected() { return client.connected(); }

int WiFiNetClient::read(uint8_t *buf, size_t len) {
  int avail = client.available();
  if (avail <= 0) {
    return 0;
  }
  size_t want = static_cast<size_t>(avail) < len ? avail : len;
  return client.read(buf, want);
}

int WiFiNetClient::write(const uint8_t *buf, size_t len) {
  int fd = client.fd();
  if (fd < 0) {
    return -1;
  }
  ssize_t sent = ::send(fd, buf, len, MSG_DONTWAIT);
  if (sent < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return 0; // send buffer full, retry next tick
    }
    return -1;
  }
  return static_cast<int>(sent);
}

void WiFiNetClient::stop() { client.stop(); }

std::string WiFiNetClient::remoteAddress() {
  return client.remoteIP().toString().c_str();
}

WiFiNetServer::WiFiNetServer() : server() {}

bool WiFiNetServer::begin(uint16_t port) {
  server.begin(port);
  server.setNoDelay(true);
  return static_cast<bool>(server);
}

std::unique_ptr<NetClient> WiFiNetServer::accept() {
  if (!server.hasClient()) {
    return std::unique_ptr<NetClient>();
  }
  WiFiClient client = server.accept();
  if (!client) {
    return std::unique_ptr<NetClient>();
  }
  return std::unique_ptr<NetClient>(new (std::nothrow) WiFiNetClient(client));
}
