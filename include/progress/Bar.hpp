#pragma once

#include "sync/Progress.hpp"

#include <cstdio>

namespace mcs::progress {

// Redraws "\r<bar> <percent>%" on every update.
class Bar final : public sync::Progress {
public:
    explicit Bar(std::FILE* out = stdout, unsigned int width = DEFAULT_WIDTH);

    void begin(const std::string& label, uint64_t total) override;
    void update(uint64_t done, uint64_t total) override;
    void end() override;

    [[nodiscard]] std::string render(uint64_t done, uint64_t total) const;

    static constexpr unsigned int DEFAULT_WIDTH = 75;

private:
    std::FILE* out_;
    unsigned int width_;
    bool active_ = false;
};

// Basic output mode: one line per finished transfer, no redraws.
class Basic final : public sync::Progress {
public:
    explicit Basic(std::FILE* out = stdout) : out_(out) {}

    void begin(const std::string& label, uint64_t total) override;
    void update(uint64_t done, uint64_t total) override;
    void end() override;

private:
    std::FILE* out_;
    std::string label_;
    uint64_t done_{}, total_{};
};

}
