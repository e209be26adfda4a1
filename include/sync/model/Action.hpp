#pragma once

#include <string>

namespace mcs::sync::model {

enum class Action {
    Download,
    Upload,
    NoOp,
};

[[nodiscard]] std::string to_string(Action action);

}
