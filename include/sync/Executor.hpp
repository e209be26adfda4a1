#pragma once

#include "sync/model/Action.hpp"

#include <atomic>
#include <cstddef>
#include <ctime>

namespace mcs::config {
struct TransferConfig;
}

namespace mcs::transport {
class Session;
}

namespace mcs::sync {

namespace model {
struct Target;
struct ScopedOp;
}

class Oracle;
class Progress;

class Executor {
public:
    Executor(transport::Session& session,
             const Oracle& oracle,
             Progress& progress,
             const config::TransferConfig& cfg,
             const std::atomic<bool>& cancel);

    // Carries out action for target and returns the local modification time
    // afterwards. For NoOp this is remoteTime.
    std::time_t execute(const model::Target& target, model::Action action, std::time_t remoteTime, model::ScopedOp& op);

private:
    transport::Session& session_;
    const Oracle& oracle_;
    Progress& progress_;
    size_t chunkSize_;
    const std::atomic<bool>& cancel_;

    std::time_t download(const model::Target& target, std::time_t remoteTime, model::ScopedOp& op);
    std::time_t upload(const model::Target& target, model::ScopedOp& op);
};

}
