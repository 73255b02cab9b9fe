#include "AppConfig.h"
#include "BuildInfo.h"
#include "DiagnosticsCollector.h"
#include "Esp32Hal.h"
#include "EventLoop.h"
#include "HttpServer.h"
#include "Log.h"
#include "PinSampler.h"
#include "ResponseRenderer.h"
#include "SnapshotStore.h"
#include <Arduino.h>
#include <ESPmDNS.h>
#include <Preferences.h>
#include <WiFi.h>

// --- SETTINGS ---
static const AppSettings settings = defaultSettings();

// --- HARDWARE BACKENDS ---
Esp32PinIo pinIo;
Esp32SystemProbe systemProbe;
Esp32Clock systemClock;
WiFiNetServer netServer;

// --- MODULE INSTANTIATION ---
PinSampler sampler(pinIo, defaultPinTable(), settings.sampler);
SnapshotStore store;
DiagnosticsCollector diagnostics(systemProbe, systemClock);
ResponseRenderer renderer(settings.sampler, settings.analogHighVolts,
                          settings.maxJsonBytes);
HttpServer httpServer(netServer, settings.server);
EventLoop eventLoop(systemClock, sampler, store, diagnostics, renderer,
                    httpServer, settings.sampleIntervalMs);

bool systemReady = false;

static void serialSink(LogLevel level, const char *line) {
  (void)level;
  Serial.println(line);
}

// --- HELPER: Credentials saved in NVS win over the compiled-in ones ---
static void loadWifiCredentials(String &ssid, String &password) {
  Preferences wifiPrefs;
  ssid = GPIOLIVE_WIFI_SSID;
  password = GPIOLIVE_WIFI_PASSWORD;

  if (!wifiPrefs.begin("wifi", true)) {
    return;
  }
  String savedSSID = wifiPrefs.getString("ssid", "");
  String savedPass = wifiPrefs.getString("password", "");
  wifiPrefs.end();

  if (savedSSID.length() > 0) {
    ssid = savedSSID;
    password = savedPass;
    logInfo("WIFI", "Using saved credentials for %s", ssid.c_str());
  }
}

// --- HELPER: Attempt WiFi Connection ---
bool attemptWifiConnection(const char *ssid, const char *password,
                           uint32_t timeoutMs) {
  WiFi.mode(WIFI_STA);
  WiFi.setHostname(GPIOLIVE_HOSTNAME);
  WiFi.setAutoReconnect(true);

  if (WiFi.status() == WL_CONNECTED) {
    return true;
  }

  Serial.print("Connecting to WiFi: ");
  Serial.println(ssid);
  WiFi.begin(ssid, password);

  unsigned long start = millis();
  while (WiFi.status() != WL_CONNECTED && millis() - start < timeoutMs) {
    delay(500);
    Serial.print(".");
  }
  Serial.println();

  if (WiFi.status() == WL_CONNECTED) {
    logInfo("WIFI", "UP  IP: %s  GW: %s  DNS: %s",
            WiFi.localIP().toString().c_str(),
            WiFi.gatewayIP().toString().c_str(),
            WiFi.dnsIP().toString().c_str());
    return true;
  }
  logWarn("WIFI", "Connection failed (timeout), serving anyway");
  return false;
}

// --- SETUP ---
void setup() {
  Serial.begin(115200);

  long startWait = millis();
  while (!Serial && (millis() - startWait < 3000)) {
    delay(10);
  }

  logSetSink(serialSink);
  Serial.println("\n\n>>> GPIO LIVE STARTING <<<");
  logInfo("BOOT", "Firmware %s (%s)",
          BuildInfo::firmwareVersion().c_str(), BuildInfo::buildStamp());

  // Boot continues without Wi-Fi; auto-reconnect restores it later
  String ssid, password;
  loadWifiCredentials(ssid, password);
  attemptWifiConnection(ssid.c_str(), password.c_str(),
                        GPIOLIVE_WIFI_TIMEOUT_MS);

  if (MDNS.begin(GPIOLIVE_HOSTNAME)) {
    MDNS.addService("http", "tcp", settings.server.port);
    logInfo("BOOT", "mDNS responder started (%s.local)",
            GPIOLIVE_HOSTNAME);
  }

  if (!sampler.begin()) {
    logError("BOOT", "Pin table rejected, nothing to serve");
    return;
  }

  if (!eventLoop.begin()) {
    logError("BOOT", "Startup failed, restarting");
    delay(1000);
    ESP.restart();
  }

  systemReady = true;
  Serial.printf("GPIO Viewer -> http://%s:%u/\n",
                WiFi.localIP().toString().c_str(),
                (unsigned)settings.server.port);
  Serial.println(">>> SYSTEM READY <<<\n");
}

// --- MAIN LOOP ---
void loop() {
  if (!systemReady) {
    delay(1000);
    return;
  }
  eventLoop.tick();
}
