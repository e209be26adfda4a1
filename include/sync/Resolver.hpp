#pragma once

#include "sync/model/Action.hpp"

#include <ctime>
#include <optional>

namespace mcs::sync {

// Newest wins. A missing local copy is always fetched.
struct Resolver {
    [[nodiscard]] static model::Action decide(std::time_t remote, std::optional<std::time_t> local) noexcept;
};

}
