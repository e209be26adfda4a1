#include "sync/model/Action.hpp"

namespace mcs::sync::model {

std::string to_string(const Action action) {
    switch (action) {
    case Action::Download: return "Download";
    case Action::Upload: return "Upload";
    case Action::NoOp: return "NoOp";
    }
    return "Unknown";
}

}
