#pragma once

#include <ctime>
#include <cstddef>

namespace mcs::transport {
class Session;
}

namespace mcs::sync {
class Progress;
class Oracle;
}

namespace mcs::sync::model {
struct Target;
struct ScopedOp;
}

namespace mcs::sync::tasks {

// Streams the local image to the remote path, then adopts the server's new
// modification time locally since the remote clock cannot be set.
struct Upload {
    transport::Session& session;
    const Oracle& oracle;
    const model::Target& target;
    size_t chunkSize;
    Progress& progress;
    model::ScopedOp& op;

    std::time_t reconciled{};

    Upload(transport::Session& session,
           const Oracle& oracle,
           const model::Target& target,
           size_t chunkSize,
           Progress& progress,
           model::ScopedOp& op);

    void operator()();
};

}
