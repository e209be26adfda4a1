#include "runtime/TargetList.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace mcs::runtime {

std::vector<std::string> loadTargetList(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Failed to open target list: " + path.string());

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Failed to parse target list " + path.string() + ": " + e.what());
    }

    if (!j.is_object()) throw std::runtime_error("Target list " + path.string() + " must be a JSON object");

    const auto it = j.find("vmcs_to_sync");
    if (it == j.end() || it->is_null()) return {};
    if (!it->is_array()) throw std::runtime_error("'vmcs_to_sync' in " + path.string() + " must be an array");

    std::vector<std::string> ids;
    ids.reserve(it->size());
    for (const auto& entry : *it) {
        if (!entry.is_string()) throw std::runtime_error("'vmcs_to_sync' entries must be strings");
        ids.push_back(entry.get<std::string>());
    }
    return ids;
}

}
