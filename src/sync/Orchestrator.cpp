#include "sync/Orchestrator.hpp"
#include "sync/Error.hpp"
#include "sync/Resolver.hpp"
#include "transport/Session.hpp"
#include "config/Config.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <chrono>

using namespace mcs::sync;
using namespace mcs::sync::model;
using namespace mcs::log;

namespace {

std::string describe(const std::optional<std::time_t>& ts) {
    return ts ? mcs::util::timestampToString(*ts) : std::string("missing");
}

mcs::transport::Session& require(const std::unique_ptr<mcs::transport::Session>& session) {
    if (!session) throw std::invalid_argument("Orchestrator requires an open session");
    return *session;
}

}

Orchestrator::Orchestrator(std::unique_ptr<transport::Session> session,
                           std::vector<Target> targets,
                           const config::Config& cfg,
                           Progress& progress,
                           const std::atomic<bool>& cancel)
    : session_(std::move(session)),
      targets_(std::move(targets)),
      cancel_(cancel),
      oracle_(require(session_)),
      executor_(*session_, oracle_, progress, cfg.transfer, cancel) {}

Orchestrator::~Orchestrator() = default;

Report Orchestrator::run() {
    const auto started = std::chrono::steady_clock::now();
    Report report;

    for (size_t i = 0; i < targets_.size(); ++i) {
        if (cancel_) {
            report.cancelled = true;
            break;
        }

        report.record(syncOne(targets_[i], i));
        if (report.cancelled) break;
    }

    session_->close();

    report.duration_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();

    if (report.cancelled) {
        Registry::sync()->warn("[Orchestrator] Sync cancelled after {}/{} targets", report.outcomes.size(), targets_.size());
        return report;
    }

    Registry::sync()->info("[Orchestrator] {} downloaded, {} uploaded, {} in sync, {} failed",
                           report.downloaded, report.uploaded, report.skipped, report.failed);
    Registry::sync()->info("Finished in {:.2f} ms", report.duration_ms);
    return report;
}

Outcome Orchestrator::syncOne(const Target& target, const size_t index) {
    Outcome outcome;
    outcome.id = target.id;

    try {
        const auto remote = oracle_.remoteModifiedTime(target.remote);
        outcome.remote_time = remote;
        outcome.state = State::RemoteTimeQueried;

        const auto local = Oracle::localModifiedTime(target.local);
        outcome.local_time = local;

        const auto action = Resolver::decide(remote, local);
        outcome.action = action;
        outcome.state = State::Decided;

        Registry::sync()->info("[{}/{}] {} <-> {} : {} (remote {}, local {})",
                               index + 1, targets_.size(), target.local.string(), target.remote,
                               to_string(action), describe(outcome.remote_time), describe(outcome.local_time));

        switch (action) {
        case Action::Download: outcome.state = State::Downloading; break;
        case Action::Upload: outcome.state = State::Uploading; break;
        case Action::NoOp: outcome.state = State::Skipped; break;
        }

        const auto reconciled = executor_.execute(target, action, remote, outcome.op);
        if (action != Action::NoOp) {
            outcome.local_time = reconciled;
            outcome.state = State::Reconciled;
        }

        outcome.state = State::Done;
    } catch (const CancelledError& e) {
        outcome.state = State::Failed;
        outcome.cancelled = true;
        outcome.error = e.what();
        Registry::sync()->warn("[Orchestrator] Cancelled while syncing {}", target.remote);
    } catch (const std::exception& e) {
        outcome.state = State::Failed;
        outcome.error = e.what();
        Registry::sync()->error("Error syncing file {}: {}", target.remote, e.what());
    }

    Registry::sync()->debug("[Orchestrator] {} {} in {} ms ({} bytes)", target.id, to_string(outcome.state),
                            outcome.op.duration_ms(), outcome.op.transferred_bytes);

    return outcome;
}
