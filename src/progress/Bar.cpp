#include "progress/Bar.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>

using namespace mcs::progress;

namespace {
constexpr const auto* BLOCK = "█";
constexpr const auto* SHADE = "░";
}

Bar::Bar(std::FILE* out, const unsigned int width) : out_(out), width_(width) {}

std::string Bar::render(const uint64_t done, const uint64_t total) const {
    const auto clamped = total == 0 ? 1.0 : std::min(1.0, static_cast<double>(done) / static_cast<double>(total));
    const auto completed = static_cast<unsigned int>(width_ * clamped);
    const auto percent = static_cast<unsigned int>(std::lround(100.0 * clamped));

    std::string bar;
    bar.reserve(width_ * 3 + 6);
    for (unsigned int i = 0; i < width_; ++i) bar += i < completed ? BLOCK : SHADE;
    return fmt::format("{} {}%", bar, percent);
}

void Bar::begin(const std::string& label, const uint64_t total) {
    active_ = true;
    fmt::print(out_, "{}\n", label);
    update(0, total);
}

void Bar::update(const uint64_t done, const uint64_t total) {
    fmt::print(out_, "\r{}", render(done, total));
    std::fflush(out_);
}

void Bar::end() {
    if (!active_) return;
    active_ = false;
    fmt::print(out_, "\n");
    std::fflush(out_);
}

void Basic::begin(const std::string& label, const uint64_t total) {
    label_ = label;
    done_ = 0;
    total_ = total;
}

void Basic::update(const uint64_t done, const uint64_t total) {
    done_ = done;
    total_ = total;
}

void Basic::end() {
    if (label_.empty()) return;
    fmt::print(out_, "{} ({}/{} bytes)\n", label_, done_, total_);
    label_.clear();
}
