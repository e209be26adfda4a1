#include <gtest/gtest.h>
#include "sync/model/Target.hpp"
#include "sync/mapping/Structured.hpp"
#include "sync/mapping/Flat.hpp"
#include "sync/Error.hpp"
#include "config/Config.hpp"
#include "TempDir.hpp"

namespace fs = std::filesystem;
using namespace mcs::sync;
using namespace mcs::sync::model;

class TargetTest : public ::testing::Test {
protected:
    mcs::test::TempDir tmp;
    mapping::Structured structured{mcs::config::RemoteConfig{}.roots};
};

TEST_F(TargetTest, ResolvesBothPaths) {
    const Target t("SLUS-21274-1.mc2", tmp.path(), structured);
    EXPECT_EQ(t.id, "SLUS-21274-1.mc2");
    EXPECT_EQ(t.remote, "PS2/SLUS-21274/SLUS-21274-1.mc2");
    EXPECT_EQ(t.local, tmp.path() / "SLUS-21274-1.bin");
}

TEST_F(TargetTest, CreatesLocalRootIdempotently) {
    const auto root = tmp / "nested/cards";
    ASSERT_FALSE(fs::exists(root));

    const Target first("SLUS-21274-1.mc2", root, structured);
    EXPECT_TRUE(fs::is_directory(root));
    EXPECT_FALSE(fs::exists(first.local));

    const Target second("SLUS-21274-2.mc2", root, structured);
    EXPECT_TRUE(fs::is_directory(root));
}

TEST_F(TargetTest, InvalidIdentifierCreatesNothing) {
    const auto root = tmp / "never";
    EXPECT_THROW(Target("SLUS-21274-9.mc2", root, structured), InvalidTargetFormatError);
    EXPECT_FALSE(fs::exists(root));
}

TEST_F(TargetTest, FlatStrategyFlattensIntoRoot) {
    const mapping::Flat flat("PS2");
    const Target t("SLUS-21274/SLUS-21274-1.mc2", tmp.path(), flat);
    EXPECT_EQ(t.remote, "PS2/SLUS-21274/SLUS-21274-1.mc2");
    EXPECT_EQ(t.local, tmp.path() / "SLUS-21274_SLUS-21274-1.bin");
}
