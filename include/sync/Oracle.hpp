#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>

namespace mcs::transport {
class Session;
}

namespace mcs::sync {

// Modification times and sizes for both sides of a target.
class Oracle {
public:
    explicit Oracle(transport::Session& session);

    // MDTM. Throws RemoteQueryError on a failed command or malformed reply.
    [[nodiscard]] std::time_t remoteModifiedTime(const std::string& remotePath) const;

    // SIZE. Throws RemoteQueryError on a failed command or malformed reply.
    [[nodiscard]] uint64_t remoteSize(const std::string& remotePath) const;

    [[nodiscard]] static std::optional<std::time_t> localModifiedTime(const std::filesystem::path& localPath);

    static constexpr const auto* REPLY_FILE_STATUS = "213";

private:
    transport::Session& session_;
};

}
