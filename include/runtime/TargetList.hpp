#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace mcs::runtime {

// Reads {"vmcs_to_sync": [...]} and returns the identifiers in file order.
[[nodiscard]] std::vector<std::string> loadTargetList(const std::filesystem::path& path);

}
