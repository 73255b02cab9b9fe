#ifndef SNAPSHOT_STORE_H
#define SNAPSHOT_STORE_H

#include <memory>

#include "PinTypes.h"

// Holds the one "current" Snapshot. Single writer (the sampling tick),
// any number of readers. A publish is a single shared_ptr swap, so a
// reader sees either the previous or the new snapshot in full, and keeps
// its copy alive for as long as it holds the pointer.
class SnapshotStore {
    private:
        std::shared_ptr<const Snapshot> latest;
        uint32_t generation;
        uint64_t lastTimestampMs;

    public:
        SnapshotStore();

        // Assigns the next generation and enforces non-decreasing
        // timestamps before swapping the pointer. Rejects nullptr.
        bool publish(std::shared_ptr<Snapshot> next);

        // Latest published snapshot; an empty generation-0 snapshot
        // before the first publish.
        std::shared_ptr<const Snapshot> current() const;

        uint32_t getGeneration() const;
};

#endif
