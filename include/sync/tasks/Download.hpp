#pragma once

#include <atomic>
#include <cstdint>
#include <ctime>

namespace mcs::transport {
class Session;
}

namespace mcs::sync {
class Progress;
}

namespace mcs::sync::model {
struct Target;
struct ScopedOp;
}

namespace mcs::sync::tasks {

// Streams the remote image into <local>.part, swaps it into place, then stamps
// the local file with the remote modification time. On any failure the
// existing local file is left untouched.
struct Download {
    transport::Session& session;
    const model::Target& target;
    std::time_t remoteTime;
    uint64_t size;
    Progress& progress;
    const std::atomic<bool>& cancel;
    model::ScopedOp& op;

    Download(transport::Session& session,
             const model::Target& target,
             std::time_t remoteTime,
             uint64_t size,
             Progress& progress,
             const std::atomic<bool>& cancel,
             model::ScopedOp& op);

    void operator()();
};

}
