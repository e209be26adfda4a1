#include "sync/Resolver.hpp"

using namespace mcs::sync;
using namespace mcs::sync::model;

Action Resolver::decide(const std::time_t remote, const std::optional<std::time_t> local) noexcept {
    if (!local) return Action::Download;
    if (remote > *local) return Action::Download;
    if (*local > remote) return Action::Upload;
    return Action::NoOp;
}
