#include "util/files.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/stat.h>

using namespace mcs::log;

namespace mcs::util {

std::optional<std::time_t> modifiedTime(const std::filesystem::path& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) return std::nullopt;
        throw std::runtime_error("Failed to stat " + path.string() + ": " + std::strerror(errno));
    }
    return st.st_mtim.tv_sec;
}

void setModifiedTime(const std::filesystem::path& path, const std::time_t ts) {
    timespec times[2];
    times[0].tv_sec = ts;
    times[0].tv_nsec = 0;
    times[1] = times[0];

    if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0)
        throw std::runtime_error("Failed to set modified time on " + path.string() + ": " + std::strerror(errno));
}

uint64_t fileSize(const std::filesystem::path& path) {
    return std::filesystem::file_size(path);
}

void ensureParentDirectories(const std::filesystem::path& path) {
    const auto parent = path.parent_path();
    if (parent.empty()) return;
    std::filesystem::create_directories(parent);
}

void removeQuietly(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec && Registry::isInitialized())
        Registry::fs()->warn("[files] Failed to remove {}: {}", path.string(), ec.message());
}

}
