#include "sync/Executor.hpp"
#include "sync/Error.hpp"
#include "sync/Oracle.hpp"
#include "sync/model/ScopedOp.hpp"
#include "sync/model/Target.hpp"
#include "sync/tasks/Download.hpp"
#include "sync/tasks/Upload.hpp"
#include "config/Config.hpp"

using namespace mcs::sync;

Executor::Executor(transport::Session& session,
                   const Oracle& oracle,
                   Progress& progress,
                   const config::TransferConfig& cfg,
                   const std::atomic<bool>& cancel)
    : session_(session), oracle_(oracle), progress_(progress), chunkSize_(cfg.chunk_size), cancel_(cancel) {
    if (chunkSize_ == 0) throw std::invalid_argument("Transfer chunk size must be greater than zero");
}

std::time_t Executor::execute(const model::Target& target, const model::Action action,
                              const std::time_t remoteTime, model::ScopedOp& op) {
    switch (action) {
    case model::Action::Download:
        return download(target, remoteTime, op);
    case model::Action::Upload:
        return upload(target, op);
    case model::Action::NoOp:
        op.start(0);
        op.success = true;
        op.stop();
        return remoteTime;
    }
    throw std::invalid_argument("Unknown sync action");
}

std::time_t Executor::download(const model::Target& target, const std::time_t remoteTime, model::ScopedOp& op) {
    const auto size = oracle_.remoteSize(target.remote);
    tasks::Download task(session_, target, remoteTime, size, progress_, cancel_, op);
    task();
    return remoteTime;
}

std::time_t Executor::upload(const model::Target& target, model::ScopedOp& op) {
    // Uploads are only cancellable before the first byte is sent.
    if (cancel_) throw CancelledError();
    tasks::Upload task(session_, oracle_, target, chunkSize_, progress_, op);
    task();
    return task.reconciled;
}
