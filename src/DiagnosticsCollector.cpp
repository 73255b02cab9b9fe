#include "DiagnosticsCollector.h"

#include "BuildInfo.h"

DiagnosticsCollector::DiagnosticsCollector(SystemProbe &probe, Clock &clock)
    : probe(probe), clock(clock), startMs(0) {}

void DiagnosticsCollector::begin() { startMs = clock.nowMs(); }

DiagnosticsSnapshot DiagnosticsCollector::collect() {
  DiagnosticsSnapshot d;

  uint64_t now = clock.nowMs();
  d.uptimeSeconds = now > startMs ? (now - startMs) / 1000 : 0;

  if (!probe.heapStats(d.heapFree, d.heapTotal)) {
    d.heapFree = 0;
    d.heapTotal = 0;
  }
  if (!probe.flashSize(d.flashSize)) {
    d.flashSize = 0;
  }
  d.hasPsram = probe.psramSize(d.psramSize) && d.psramSize > 0;
  if (!d.hasPsram) {
    d.psramSize = 0;
  }
  if (!probe.cpuFreqMhz(d.cpuFreqMhz)) {
    d.cpuFreqMhz = 0;
  }
  if (!probe.chipModel(d.chipModel) || d.chipModel.empty()) {
    d.chipModel = DIAG_UNKNOWN;
  }
  if (!probe.cores(d.cores)) {
    d.cores = 0;
  }

  // --- Network identity ---
  NetworkInfo net;
  probe.networkInfo(net);
  d.networkUp = net.associated;
  d.mac = net.mac.empty() ? DIAG_NO_MAC : net.mac;
  if (net.associated) {
    d.ip = net.ip.empty() ? DIAG_NO_ADDRESS : net.ip;
    d.ssid = net.ssid;
    d.rssi = net.rssi;
    d.gateway = net.gateway.empty() ? DIAG_NO_ADDRESS : net.gateway;
    d.dns = net.dns.empty() ? DIAG_NO_ADDRESS : net.dns;
  } else {
    d.ip = DIAG_NO_ADDRESS;
    d.ssid = "";
    d.rssi = 0;
    d.gateway = DIAG_NO_ADDRESS;
    d.dns = DIAG_NO_ADDRESS;
  }

  d.firmwareVersion = BuildInfo::firmwareVersion();
  d.build = BuildInfo::buildStamp();
  return d;
}
