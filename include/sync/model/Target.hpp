#pragma once

#include <filesystem>
#include <string>

namespace mcs::sync::mapping {
class Strategy;
}

namespace mcs::sync::model {

// One card image to keep in sync. Resolved once at startup and never mutated.
struct Target {
    std::string id;
    std::string remote;
    std::filesystem::path local;

    // Resolves both paths through the strategy and creates local parent directories.
    // Throws InvalidTargetFormatError when the identifier is malformed.
    Target(std::string identifier, const std::filesystem::path& localRoot, const mapping::Strategy& strategy);
};

}
