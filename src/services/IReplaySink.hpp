#pragma once

#include <string>

namespace obr::services {

enum class StopReason {
    None,
    SnapshotBoundary,   // next Snapshot emitted, then stopped
    Exhausted,          // caught up with the store
    Cancelled,
    SinkClosed,
    StoreError,
    StaleReference,     // start point no longer stored
};

inline std::string to_string(StopReason reason) {
    switch (reason) {
        case StopReason::None: return "none";
        case StopReason::SnapshotBoundary: return "snapshot_boundary";
        case StopReason::Exhausted: return "exhausted";
        case StopReason::Cancelled: return "cancelled";
        case StopReason::SinkClosed: return "sink_closed";
        case StopReason::StoreError: return "store_error";
        case StopReason::StaleReference: return "stale_reference";
    }
    return "unknown";
}

// Where a replay session writes its payloads, typically one client connection.
class IReplaySink {
public:
    // Returns false once the client is gone.
    virtual bool send(const std::string& payload) = 0;
    // Called exactly once when the session ends.
    virtual void close(StopReason reason, const std::string& detail) = 0;
    virtual ~IReplaySink() = default;
};

} // namespace obr::services
