#include <gtest/gtest.h>
#include "progress/Bar.hpp"

#include <cstdio>

using namespace mcs::progress;

namespace {

std::string repeat(const std::string& s, const unsigned int n) {
    std::string out;
    for (unsigned int i = 0; i < n; ++i) out += s;
    return out;
}

std::string drain(std::FILE* f) {
    std::fflush(f);
    std::rewind(f);
    std::string out;
    char buf[256];
    while (const auto n = std::fread(buf, 1, sizeof(buf), f)) out.append(buf, n);
    return out;
}

}

TEST(ProgressBarTest, RendersSeventyFiveCells) {
    const Bar bar(nullptr);
    EXPECT_EQ(bar.render(0, 100), repeat("░", 75) + " 0%");
    EXPECT_EQ(bar.render(50, 100), repeat("█", 37) + repeat("░", 38) + " 50%");
    EXPECT_EQ(bar.render(100, 100), repeat("█", 75) + " 100%");
}

TEST(ProgressBarTest, EmptyTransferRendersComplete) {
    const Bar bar(nullptr, 10);
    EXPECT_EQ(bar.render(0, 0), repeat("█", 10) + " 100%");
}

TEST(ProgressBarTest, RedrawsInPlace) {
    std::FILE* f = std::tmpfile();
    ASSERT_NE(f, nullptr);
    {
        Bar bar(f, 4);
        bar.begin("Downloading SLUS-21274-1.bin", 8);
        bar.update(4, 8);
        bar.update(8, 8);
        bar.end();
    }
    const auto out = drain(f);
    std::fclose(f);

    EXPECT_EQ(out, "Downloading SLUS-21274-1.bin\n"
                   "\r░░░░ 0%"
                   "\r██░░ 50%"
                   "\r████ 100%\n");
}

TEST(ProgressBasicTest, PrintsOneLinePerTransfer) {
    std::FILE* f = std::tmpfile();
    ASSERT_NE(f, nullptr);
    {
        Basic basic(f);
        basic.begin("Uploading SLUS-21274-1.bin", 10);
        basic.update(4, 10);
        basic.update(10, 10);
        basic.end();
        basic.end();
    }
    const auto out = drain(f);
    std::fclose(f);

    EXPECT_EQ(out, "Uploading SLUS-21274-1.bin (10/10 bytes)\n");
}
