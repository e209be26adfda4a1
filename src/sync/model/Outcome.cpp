#include "sync/model/Outcome.hpp"

namespace mcs::sync::model {

std::string to_string(const State state) {
    switch (state) {
    case State::Idle: return "idle";
    case State::RemoteTimeQueried: return "remote_time_queried";
    case State::Decided: return "decided";
    case State::Downloading: return "downloading";
    case State::Uploading: return "uploading";
    case State::Skipped: return "skipped";
    case State::Reconciled: return "reconciled";
    case State::Done: return "done";
    case State::Failed: return "failed";
    }
    return "unknown";
}

}
