#pragma once

#include "sync/Executor.hpp"
#include "sync/Oracle.hpp"
#include "sync/model/Report.hpp"
#include "sync/model/Target.hpp"

#include <atomic>
#include <memory>
#include <vector>

namespace mcs::config {
struct Config;
}

namespace mcs::transport {
class Session;
}

namespace mcs::sync {

class Progress;

// Runs query -> decide -> execute for every target, strictly in order, over one
// session. A failing target is logged and skipped; cancellation ends the run.
class Orchestrator {
public:
    Orchestrator(std::unique_ptr<transport::Session> session,
                 std::vector<model::Target> targets,
                 const config::Config& cfg,
                 Progress& progress,
                 const std::atomic<bool>& cancel);

    ~Orchestrator();

    model::Report run();

private:
    std::unique_ptr<transport::Session> session_;
    std::vector<model::Target> targets_;
    const std::atomic<bool>& cancel_;
    Oracle oracle_;
    Executor executor_;

    model::Outcome syncOne(const model::Target& target, size_t index);
};

}
