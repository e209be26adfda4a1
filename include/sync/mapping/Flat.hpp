#pragma once

#include "sync/mapping/Strategy.hpp"

namespace mcs::sync::mapping {

// Legacy layout: identifiers are <CardName>/<CardName>-<Channel>.mc2 relative to
// the PS2 root, and local copies are flattened to <localRoot>/<CardName>_<CardName>-<Channel>.bin
class Flat final : public Strategy {
public:
    explicit Flat(std::string root);

    [[nodiscard]] std::string toRemote(const std::string& id) const override;
    [[nodiscard]] std::filesystem::path toLocal(const std::string& id,
                                                const std::filesystem::path& localRoot) const override;
    [[nodiscard]] std::string name() const override { return "flat"; }

private:
    std::string root_;

    void validate(const std::string& id) const;
};

}
