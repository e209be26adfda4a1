#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace mcs::config {

namespace {

template<typename T>
void decodeSection(const YAML::Node& root, const std::string& key, T& out, const std::filesystem::path& path) {
    const auto node = root[key];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, out))
        throw std::runtime_error("Malformed '" + key + "' section in " + path.string());
}

}

Config defaultConfig() { return {}; }

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) throw std::runtime_error("Config file not found: " + path.string());

    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    decodeSection(root, "ftp", cfg.ftp, path);
    decodeSection(root, "sync", cfg.sync, path);
    decodeSection(root, "transfer", cfg.transfer, path);
    decodeSection(root, "remote", cfg.remote, path);
    decodeSection(root, "logging", cfg.logging, path);

    if (cfg.remote.roots.empty()) throw std::runtime_error("remote.roots must name at least one extension");

    return cfg;
}

std::string to_string(const Naming naming) {
    switch (naming) {
    case Naming::Structured: return "structured";
    case Naming::Flat: return "flat";
    }
    return "unknown";
}

Naming namingFromString(const std::string& str) {
    if (str == "structured") return Naming::Structured;
    if (str == "flat") return Naming::Flat;
    throw std::invalid_argument("Unknown naming strategy: " + str);
}

}
