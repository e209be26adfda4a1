#include "sync/Oracle.hpp"
#include "sync/Error.hpp"
#include "transport/Session.hpp"
#include "util/files.hpp"
#include "util/timestamp.hpp"

using namespace mcs::sync;

Oracle::Oracle(transport::Session& session) : session_(session) {}

std::time_t Oracle::remoteModifiedTime(const std::string& remotePath) const {
    const auto reply = session_.query("MDTM " + remotePath, REPLY_FILE_STATUS);
    try {
        return util::parseMdtmTimestamp(reply);
    } catch (const std::exception& e) {
        throw RemoteQueryError("MDTM " + remotePath + " returned an unusable reply: " + e.what());
    }
}

uint64_t Oracle::remoteSize(const std::string& remotePath) const {
    const auto reply = session_.query("SIZE " + remotePath, REPLY_FILE_STATUS);
    if (reply.empty() || reply.find_first_not_of("0123456789") != std::string::npos)
        throw RemoteQueryError("SIZE " + remotePath + " returned an unusable reply: '" + reply + "'");
    try {
        return std::stoull(reply);
    } catch (const std::out_of_range&) {
        throw RemoteQueryError("SIZE " + remotePath + " is out of range: '" + reply + "'");
    }
}

std::optional<std::time_t> Oracle::localModifiedTime(const std::filesystem::path& localPath) {
    return util::modifiedTime(localPath);
}
