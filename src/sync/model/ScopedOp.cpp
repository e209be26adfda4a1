#include "sync/model/ScopedOp.hpp"

#include <chrono>

using namespace mcs::sync::model;
using namespace std::chrono;

void ScopedOp::start() {
    transferred_bytes = 0;
    success = false;
    timestamp_begin = system_clock::to_time_t(system_clock::now());
}

void ScopedOp::stop() { timestamp_end = system_clock::to_time_t(system_clock::now()); }

void ScopedOp::start(const uint64_t size_bytes) {
    this->size_bytes = size_bytes;
    start();
}

uint64_t ScopedOp::duration_ms() const {
    if (timestamp_end < timestamp_begin) return 0;
    return duration_cast<milliseconds>(system_clock::from_time_t(timestamp_end) - system_clock::from_time_t(timestamp_begin)).count();
}
