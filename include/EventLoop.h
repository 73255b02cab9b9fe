#ifndef EVENT_LOOP_H
#define EVENT_LOOP_H

#include "Clock.h"
#include "DiagnosticsCollector.h"
#include "HttpServer.h"
#include "PinSampler.h"
#include "ResponseRenderer.h"
#include "SnapshotStore.h"

struct LoopStats {
    uint32_t ticks;
    uint32_t samples;
    uint32_t lateSamples; // cadence re-anchored after falling behind
    uint32_t maxLagMs;    // worst delay of a sample past its due time
    uint32_t renderFailures;

    LoopStats()
        : ticks(0), samples(0), lateSamples(0), maxLagMs(0),
          renderFailures(0) {}
};

// The cooperative scheduler. Call tick() from loop() as often as possible;
// nothing inside it waits on I/O.
class EventLoop : public RequestDispatcher {
    private:
        Clock &clock;
        PinSampler &sampler;
        SnapshotStore &store;
        DiagnosticsCollector &diagnostics;
        ResponseRenderer &renderer;
        HttpServer &server;

        uint32_t sampleIntervalMs;
        uint64_t nextSampleMs;
        LoopStats stats;

        bool sampleNow(uint64_t nowMs);
        DiagnosticsSnapshot collectDiagnostics();

    public:
        EventLoop(Clock &clock, PinSampler &sampler, SnapshotStore &store,
                  DiagnosticsCollector &diagnostics, ResponseRenderer &renderer,
                  HttpServer &server, uint32_t sampleIntervalMs);

        // Starts the listener and publishes the first snapshot. False if
        // either fails; the caller treats that as fatal.
        bool begin();

        // 1. sample + publish when due, 2. poll the HTTP server
        void tick();

        void dispatch(Route route, const HttpRequest &request,
                      HttpResponse &response) override;
        bool nextEvent(uint32_t &lastGeneration, std::string &event) override;

        const LoopStats &getStats() const;
        uint64_t getNextSampleMs() const;
};

#endif
