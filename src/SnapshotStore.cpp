#include "SnapshotStore.h"

#include <atomic>
#include <utility>

#include "Log.h"

static const char *TAG = "STORE";

SnapshotStore::SnapshotStore()
    : latest(std::make_shared<Snapshot>()), generation(0),
      lastTimestampMs(0) {}

bool SnapshotStore::publish(std::shared_ptr<Snapshot> next) {
  if (!next) {
    logError(TAG, "Refusing to publish an empty snapshot");
    return false;
  }

  if (next->timestampMs < lastTimestampMs) {
    logWarn(TAG, "Clock went backwards (%lu < %lu ms), clamping",
            (unsigned long)next->timestampMs,
            (unsigned long)lastTimestampMs);
    next->timestampMs = lastTimestampMs;
  }
  next->generation = generation + 1;

  // Everything above touches only the new object; readers can't see it yet
  std::shared_ptr<const Snapshot> frozen(std::move(next));
  std::atomic_store(&latest, frozen);

  generation = frozen->generation;
  lastTimestampMs = frozen->timestampMs;
  return true;
}

std::shared_ptr<const Snapshot> SnapshotStore::current() const {
  return std::atomic_load(&latest);
}

uint32_t SnapshotStore::getGeneration() const { return generation; }
