#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace mcs::config {
struct Config;
}

namespace mcs::sync::mapping {

// Maps a target identifier to its remote and local locations. Implementations
// are pure: no filesystem or network access.
class Strategy {
public:
    virtual ~Strategy() = default;

    [[nodiscard]] virtual std::string toRemote(const std::string& id) const = 0;
    [[nodiscard]] virtual std::filesystem::path toLocal(const std::string& id,
                                                        const std::filesystem::path& localRoot) const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

[[nodiscard]] std::unique_ptr<Strategy> create(const config::Config& cfg);

}
