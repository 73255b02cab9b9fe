#include "EventLoop.h"

#include "Log.h"

static const char *TAG = "LOOP";

EventLoop::EventLoop(Clock &clock, PinSampler &sampler, SnapshotStore &store,
                     DiagnosticsCollector &diagnostics,
                     ResponseRenderer &renderer, HttpServer &server,
                     uint32_t sampleIntervalMs)
    : clock(clock), sampler(sampler), store(store), diagnostics(diagnostics),
      renderer(renderer), server(server), sampleIntervalMs(sampleIntervalMs),
      nextSampleMs(0) {}

bool EventLoop::begin() {
  diagnostics.begin();

  uint64_t now = clock.nowMs();
  if (!sampleNow(now)) {
    logError(TAG, "Could not allocate the first snapshot");
    return false;
  }
  nextSampleMs = now + sampleIntervalMs;

  if (!server.begin()) {
    return false;
  }
  logInfo(TAG, "Sampling every %lu ms", (unsigned long)sampleIntervalMs);
  return true;
}

bool EventLoop::sampleNow(uint64_t nowMs) {
  std::shared_ptr<Snapshot> snap = sampler.sample(nowMs);
  if (!snap) {
    return false;
  }
  if (!store.publish(snap)) {
    return false;
  }
  stats.samples++;
  return true;
}

void EventLoop::tick() {
  stats.ticks++;
  uint64_t now = clock.nowMs();

  // 1. Sampling always goes first, whatever the clients are doing
  if (now >= nextSampleMs) {
    uint64_t lag = now - nextSampleMs;
    if (lag > stats.maxLagMs) {
      stats.maxLagMs = static_cast<uint32_t>(lag);
    }

    if (!sampleNow(now)) {
      logWarn(TAG, "Sample skipped, keeping previous snapshot");
    }

    nextSampleMs += sampleIntervalMs;
    if (nextSampleMs <= now) {
      // More than one interval behind: re-anchor instead of bursting
      stats.lateSamples++;
      nextSampleMs = now + sampleIntervalMs;
    }
  }

  // 2 + 3. Accept and advance connections
  server.poll(now, *this);
}

DiagnosticsSnapshot EventLoop::collectDiagnostics() {
  DiagnosticsSnapshot diag = diagnostics.collect();
  diag.sampleIntervalMs = sampleIntervalMs;
  diag.clients = static_cast<uint32_t>(server.activeConnections());
  return diag;
}

void EventLoop::dispatch(Route route, const HttpRequest &request,
                         HttpResponse &response) {
  std::shared_ptr<const Snapshot> snap = store.current();

  // Only the dashboard and /info need the system counters
  DiagnosticsSnapshot diag;
  if (route == Route::Dashboard || route == Route::Info) {
    diag = collectDiagnostics();
  }

  response.contentType = contentTypeFor(route);
  if (route == Route::Events) {
    // Headers now, frames from nextEvent() on later ticks
    response.status = 200;
    response.streaming = true;
    response.body.clear();
    return;
  }

  if (!renderer.render(route, *snap, diag, response.body)) {
    stats.renderFailures++;
    logError(TAG, "Render failed for %s", request.path.c_str());
    response.status = 500;
    response.contentType = "text/plain";
    response.body = statusText(500);
    return;
  }
  response.status = 200;
}

bool EventLoop::nextEvent(uint32_t &lastGeneration, std::string &event) {
  std::shared_ptr<const Snapshot> snap = store.current();
  if (snap->generation == lastGeneration) {
    return false;
  }
  if (!renderer.renderEvent(*snap, event)) {
    stats.renderFailures++;
    return false;
  }
  lastGeneration = snap->generation;
  return true;
}

const LoopStats &EventLoop::getStats() const { return stats; }

uint64_t EventLoop::getNextSampleMs() const { return nextSampleMs; }
