#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>

namespace mcs::util {

// Whole-second mtime of a regular file, or nullopt if nothing exists at path.
[[nodiscard]] std::optional<std::time_t> modifiedTime(const std::filesystem::path& path);

// Sets both atime and mtime of path to ts.
void setModifiedTime(const std::filesystem::path& path, std::time_t ts);

[[nodiscard]] uint64_t fileSize(const std::filesystem::path& path);

void ensureParentDirectories(const std::filesystem::path& path);

// Removes path if present, never throws. Used on failure paths.
void removeQuietly(const std::filesystem::path& path) noexcept;

}
