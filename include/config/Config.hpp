#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <spdlog/spdlog.h>

namespace mcs::config {

struct FtpConfig {
    std::string host;
    uint16_t port = 21;
    unsigned int timeout_seconds = 30;
    std::string user_env = "MCP2_USER";
    std::string password_env = "MCP2_PWD";
};

enum class Naming { Structured, Flat };

struct SyncConfig {
    std::filesystem::path local_root = ".";
    std::filesystem::path targets_file = "targets.json";
    Naming naming = Naming::Structured;
    bool basic_output = false;
};

struct TransferConfig {
    size_t chunk_size = 1024;
};

struct RemoteConfig {
    // remote extension (lowercase, no dot) -> remote root directory
    std::map<std::string, std::string> roots{{"mc2", "PS2"}, {"mcd", "PS1"}};
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum ps2mcs = spdlog::level::info;
    spdlog::level::level_enum sync   = spdlog::level::info;
    spdlog::level::level_enum ftp    = spdlog::level::warn;
    spdlog::level::level_enum fs     = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "logs";
    bool console = true;
    LogLevelsConfig levels;
};

struct Config {
    FtpConfig ftp;
    SyncConfig sync;
    TransferConfig transfer;
    RemoteConfig remote;
    LoggingConfig logging;
};

[[nodiscard]] Config defaultConfig();
[[nodiscard]] Config loadConfig(const std::filesystem::path& path);

[[nodiscard]] std::string to_string(Naming naming);
[[nodiscard]] Naming namingFromString(const std::string& str);

}
