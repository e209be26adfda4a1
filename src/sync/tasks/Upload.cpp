#include "sync/tasks/Upload.hpp"
#include "sync/Error.hpp"
#include "sync/Oracle.hpp"
#include "sync/Progress.hpp"
#include "sync/model/ScopedOp.hpp"
#include "sync/model/Target.hpp"
#include "transport/Session.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fstream>

using namespace mcs::sync::tasks;
using namespace mcs::sync;
using namespace mcs::log;

Upload::Upload(transport::Session& session,
               const Oracle& oracle,
               const model::Target& target,
               const size_t chunkSize,
               Progress& progress,
               model::ScopedOp& op)
    : session(session), oracle(oracle), target(target), chunkSize(chunkSize), progress(progress), op(op) {}

void Upload::operator()() {
    const auto size = util::fileSize(target.local);
    op.start(size);

    std::ifstream in(target.local, std::ios::binary);
    if (!in) {
        op.stop();
        throw TransferError("Failed to open " + target.local.string() + " for reading");
    }

    progress.begin("Uploading " + target.local.filename().string(), size);

    try {
        session.upload(target.remote, [&](char* buf, const size_t max) -> size_t {
            in.read(buf, static_cast<std::streamsize>(std::min(max, chunkSize)));
            if (in.bad()) throw TransferError("Failed reading " + target.local.string());
            const auto n = static_cast<size_t>(in.gcount());
            op.transferred_bytes += n;
            if (n > 0) progress.update(op.transferred_bytes, size);
            return n;
        }, size);
    } catch (...) {
        progress.end();
        op.stop();
        throw;
    }

    progress.end();

    reconciled = oracle.remoteModifiedTime(target.remote);
    util::setModifiedTime(target.local, reconciled);

    op.success = true;
    op.stop();

    Registry::sync()->debug("[UploadTask] {} -> {} ({} bytes)", target.local.string(), target.remote, op.transferred_bytes);
}
