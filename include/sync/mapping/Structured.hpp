#pragma once

#include "sync/mapping/Strategy.hpp"

#include <map>
#include <string>

namespace mcs::sync::mapping {

// <CardName>-<Channel>.<ext>  ->  <root-for-ext>/<CardName>/<CardName>-<Channel>.<ext>
//                             ->  <localRoot>/<CardName>-<Channel>.<bin|ext>
class Structured final : public Strategy {
public:
    struct Parts {
        std::string card;
        unsigned int channel{};
        std::string ext;     // as written in the identifier
        std::string root;    // remote root for ext
    };

    // roots: lowercase extension -> remote root directory
    explicit Structured(std::map<std::string, std::string> roots);

    [[nodiscard]] std::string toRemote(const std::string& id) const override;
    [[nodiscard]] std::filesystem::path toLocal(const std::string& id,
                                                const std::filesystem::path& localRoot) const override;
    [[nodiscard]] std::string name() const override { return "structured"; }

    [[nodiscard]] Parts parse(const std::string& id) const;

    static constexpr const auto* REMOTE_NATIVE_EXT = "mc2";
    static constexpr const auto* LOCAL_NATIVE_EXT = "bin";

private:
    std::map<std::string, std::string> roots_;
};

}
