#pragma once

#include "config/Config.hpp"
#include <cctype>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace mcs::config;

template<>
struct convert<FtpConfig> {
    static Node encode(const FtpConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["timeout_seconds"] = rhs.timeout_seconds;
        node["user_env"] = rhs.user_env;
        node["password_env"] = rhs.password_env;
        return node;
    }

    static bool decode(const Node& node, FtpConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("");
        rhs.port = node["port"].as<uint16_t>(21);
        rhs.timeout_seconds = node["timeout_seconds"].as<unsigned int>(30);
        rhs.user_env = node["user_env"].as<std::string>("MCP2_USER");
        rhs.password_env = node["password_env"].as<std::string>("MCP2_PWD");
        return true;
    }
};

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["local_root"] = rhs.local_root.string();
        node["targets_file"] = rhs.targets_file.string();
        node["naming"] = to_string(rhs.naming);
        node["basic_output"] = rhs.basic_output;
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.local_root = node["local_root"].as<std::string>(".");
        rhs.targets_file = node["targets_file"].as<std::string>("targets.json");
        rhs.naming = namingFromString(node["naming"].as<std::string>("structured"));
        rhs.basic_output = node["basic_output"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<TransferConfig> {
    static Node encode(const TransferConfig& rhs) {
        Node node;
        node["chunk_size"] = rhs.chunk_size;
        return node;
    }

    static bool decode(const Node& node, TransferConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.chunk_size = node["chunk_size"].as<size_t>(1024);
        if (rhs.chunk_size == 0) throw std::invalid_argument("transfer.chunk_size must be greater than zero");
        return true;
    }
};

template<>
struct convert<RemoteConfig> {
    static Node encode(const RemoteConfig& rhs) {
        Node node;
        for (const auto& [ext, root] : rhs.roots) node["roots"][ext] = root;
        return node;
    }

    static bool decode(const Node& node, RemoteConfig& rhs) {
        if (!node.IsMap()) return false;
        if (const auto roots = node["roots"]) {
            if (!roots.IsMap()) return false;
            rhs.roots.clear();
            for (const auto& kv : roots) {
                auto ext = kv.first.as<std::string>();
                if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
                for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                rhs.roots[ext] = kv.second.as<std::string>();
            }
        }
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["ps2mcs"] = to_std_string(spdlog::level::to_string_view(rhs.ps2mcs));
        node["sync"]   = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["ftp"]    = to_std_string(spdlog::level::to_string_view(rhs.ftp));
        node["fs"]     = to_std_string(spdlog::level::to_string_view(rhs.fs));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.ps2mcs = spdlog::level::from_str(node["ps2mcs"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.ftp = spdlog::level::from_str(node["ftp"].as<std::string>("warning"));
        rhs.fs = spdlog::level::from_str(node["fs"].as<std::string>("warning"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"])
            if (!convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels)) return false;
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["console"] = rhs.console;
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("logs");
        rhs.console = node["console"].as<bool>(true);
        if (const auto levels = node["log_levels"])
            if (!convert<LogLevelsConfig>::decode(levels, rhs.levels)) return false;
        return true;
    }
};

}
