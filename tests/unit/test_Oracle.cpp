#include <gtest/gtest.h>
#include "sync/Oracle.hpp"
#include "sync/Error.hpp"
#include "util/files.hpp"
#include "FakeSession.hpp"
#include "TempDir.hpp"

using namespace mcs::sync;
using namespace mcs::test;

class OracleTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeRemote> remote = std::make_shared<FakeRemote>();
    FakeSession session{remote};
    Oracle oracle{session};
    TempDir tmp;

    void SetUp() override {
        remote->files["PS2/SLUS-21274/SLUS-21274-1.mc2"] = {"card-data", 1704164645};
    }
};

TEST_F(OracleTest, ReadsRemoteModifiedTime) {
    EXPECT_EQ(oracle.remoteModifiedTime("PS2/SLUS-21274/SLUS-21274-1.mc2"), 1704164645);
    ASSERT_FALSE(remote->commands.empty());
    EXPECT_EQ(remote->commands.back(), "MDTM PS2/SLUS-21274/SLUS-21274-1.mc2");
}

TEST_F(OracleTest, AcceptsFractionalMdtmReply) {
    remote->mdtmOverride["PS2/SLUS-21274/SLUS-21274-1.mc2"] = "20240102030405.250";
    EXPECT_EQ(oracle.remoteModifiedTime("PS2/SLUS-21274/SLUS-21274-1.mc2"), 1704164645);
}

TEST_F(OracleTest, MalformedReplyIsRemoteQueryError) {
    remote->mdtmOverride["PS2/SLUS-21274/SLUS-21274-1.mc2"] = "yesterday";
    EXPECT_THROW((void)oracle.remoteModifiedTime("PS2/SLUS-21274/SLUS-21274-1.mc2"), RemoteQueryError);
}

TEST_F(OracleTest, MissingRemoteFileIsRemoteQueryError) {
    EXPECT_THROW((void)oracle.remoteModifiedTime("PS2/SCUS-97113/SCUS-97113-1.mc2"), RemoteQueryError);
    EXPECT_THROW((void)oracle.remoteSize("PS2/SCUS-97113/SCUS-97113-1.mc2"), RemoteQueryError);
}

TEST_F(OracleTest, ReadsRemoteSize) {
    EXPECT_EQ(oracle.remoteSize("PS2/SLUS-21274/SLUS-21274-1.mc2"), 9u);
}

TEST_F(OracleTest, LocalTimeIsEmptyForMissingFile) {
    EXPECT_FALSE(Oracle::localModifiedTime(tmp / "absent.bin").has_value());
}

TEST_F(OracleTest, LocalTimeHasSecondResolution) {
    const auto file = tmp / "card.bin";
    writeFile(file, "x");
    mcs::util::setModifiedTime(file, 1700000000);

    const auto local = Oracle::localModifiedTime(file);
    ASSERT_TRUE(local.has_value());
    EXPECT_EQ(*local, 1700000000);
}
