#pragma once

#include <chrono>
#include <string>

class StandingsSnapshot;

// Destination for completed snapshots. Only whole snapshots are handed over.
class ISnapshotSink {
public:
    virtual ~ISnapshotSink() = default;

    // Returns where the snapshot was stored. Throws TransientPollError on failure.
    virtual std::string persist(const StandingsSnapshot& snapshot,
        std::chrono::system_clock::time_point capturedAt) = 0;
};
