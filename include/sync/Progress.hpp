#pragma once

#include <cstdint>
#include <string>

namespace mcs::sync {

// Observes a single transfer. Never influences control flow.
class Progress {
public:
    virtual ~Progress() = default;

    virtual void begin(const std::string& label, uint64_t total) = 0;
    virtual void update(uint64_t done, uint64_t total) = 0;
    virtual void end() = 0;
};

}
