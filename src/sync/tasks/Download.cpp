#include "sync/tasks/Download.hpp"
#include "sync/Error.hpp"
#include "sync/Progress.hpp"
#include "sync/model/ScopedOp.hpp"
#include "sync/model/Target.hpp"
#include "transport/Session.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <fstream>

using namespace mcs::sync::tasks;
using namespace mcs::sync;
using namespace mcs::log;

Download::Download(transport::Session& session,
                   const model::Target& target,
                   const std::time_t remoteTime,
                   const uint64_t size,
                   Progress& progress,
                   const std::atomic<bool>& cancel,
                   model::ScopedOp& op)
    : session(session), target(target), remoteTime(remoteTime), size(size),
      progress(progress), cancel(cancel), op(op) {}

void Download::operator()() {
    auto partial = target.local;
    partial += ".part";

    op.start(size);

    std::ofstream out(partial, std::ios::binary | std::ios::trunc);
    if (!out) {
        op.stop();
        throw TransferError("Failed to open " + partial.string() + " for writing");
    }

    progress.begin("Downloading " + target.local.filename().string(), size);

    try {
        session.download(target.remote, [&](const char* data, const size_t len) {
            if (cancel) throw CancelledError();
            out.write(data, static_cast<std::streamsize>(len));
            if (!out) throw TransferError("Failed writing to " + partial.string());
            op.transferred_bytes += len;
            progress.update(op.transferred_bytes, size);
        });

        out.close();
        if (out.fail()) throw TransferError("Failed to flush " + partial.string());
    } catch (...) {
        out.close();
        util::removeQuietly(partial);
        progress.end();
        op.stop();
        throw;
    }

    progress.end();

    std::error_code ec;
    std::filesystem::rename(partial, target.local, ec);
    if (ec) {
        util::removeQuietly(partial);
        op.stop();
        throw TransferError("Failed to move " + partial.string() + " into place: " + ec.message());
    }

    util::setModifiedTime(target.local, remoteTime);

    op.success = true;
    op.stop();

    Registry::sync()->debug("[DownloadTask] {} -> {} ({} bytes)", target.remote, target.local.string(), op.transferred_bytes);
}
