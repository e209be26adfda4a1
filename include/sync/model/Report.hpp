#pragma once

#include "sync/model/Outcome.hpp"

#include <cstdint>
#include <vector>

namespace mcs::sync::model {

struct Report {
    std::vector<Outcome> outcomes;
    unsigned int downloaded{};
    unsigned int uploaded{};
    unsigned int skipped{};
    unsigned int failed{};
    bool cancelled{};
    double duration_ms{};

    void record(Outcome outcome);
    [[nodiscard]] bool ok() const { return failed == 0 && !cancelled; }
};

}
