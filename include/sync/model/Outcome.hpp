#pragma once

#include "sync/model/Action.hpp"
#include "sync/model/ScopedOp.hpp"

#include <ctime>
#include <optional>
#include <string>

namespace mcs::sync::model {

enum class State {
    Idle,
    RemoteTimeQueried,
    Decided,
    Downloading,
    Uploading,
    Skipped,
    Reconciled,
    Done,
    Failed,
};

[[nodiscard]] std::string to_string(State state);

// Per-target result, reporting only.
struct Outcome {
    std::string id;
    State state{State::Idle};
    std::optional<Action> action;
    std::optional<std::time_t> remote_time;
    std::optional<std::time_t> local_time;
    std::string error;
    bool cancelled{};
    ScopedOp op;

    [[nodiscard]] bool failed() const { return state == State::Failed; }
};

}
