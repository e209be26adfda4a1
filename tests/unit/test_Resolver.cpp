#include <gtest/gtest.h>
#include "sync/Resolver.hpp"

using namespace mcs::sync;
using namespace mcs::sync::model;

TEST(ResolverTest, MissingLocalAlwaysDownloads) {
    EXPECT_EQ(Resolver::decide(0, std::nullopt), Action::Download);
    EXPECT_EQ(Resolver::decide(1700000000, std::nullopt), Action::Download);
}

TEST(ResolverTest, NewestSideWins) {
    EXPECT_EQ(Resolver::decide(1700000100, 1700000000), Action::Download);
    EXPECT_EQ(Resolver::decide(1700000000, 1700000100), Action::Upload);
    EXPECT_EQ(Resolver::decide(1700000000, 1700000000), Action::NoOp);
}

TEST(ResolverTest, OneSecondIsEnough) {
    EXPECT_EQ(Resolver::decide(1700000001, 1700000000), Action::Download);
    EXPECT_EQ(Resolver::decide(1700000000, 1700000001), Action::Upload);
}

TEST(ResolverTest, SwappingTimesSwapsDirection) {
    const std::time_t samples[] = {0, 1, 946684800, 1700000000, 1704164645};
    for (const auto a : samples) {
        for (const auto b : samples) {
            const auto forward = Resolver::decide(a, b);
            const auto backward = Resolver::decide(b, a);
            if (a == b) {
                EXPECT_EQ(forward, Action::NoOp);
                EXPECT_EQ(backward, Action::NoOp);
            } else if (forward == Action::Download) EXPECT_EQ(backward, Action::Upload);
            else EXPECT_EQ(backward, Action::Download);
        }
    }
}

TEST(ResolverTest, ActionNames) {
    EXPECT_EQ(to_string(Action::Download), "Download");
    EXPECT_EQ(to_string(Action::Upload), "Upload");
    EXPECT_EQ(to_string(Action::NoOp), "NoOp");
}
