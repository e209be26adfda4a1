#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mcs::config {
struct Config;
}

namespace mcs::runtime {

constexpr const auto* VERSION = "0.4.0";

struct Args {
    std::optional<std::string> ftpHost;
    std::optional<std::filesystem::path> local;
    std::optional<std::filesystem::path> config;
    std::optional<std::filesystem::path> targets;
    bool basic = false;
    bool version = false;
    bool help = false;
};

struct ArgsParse {
    bool ok = false;
    Args args;
    std::string error;
};

// Accepts "-f HOST", "--ftp_host HOST" and "--ftp_host=HOST" forms.
[[nodiscard]] ArgsParse parseArgs(const std::vector<std::string>& argv);

[[nodiscard]] std::string usage(const std::string& prog = "ps2mcs");

// Overlays command-line values onto cfg. Throws std::invalid_argument if no
// FTP host ends up configured.
void applyArgs(const Args& args, config::Config& cfg);

}
