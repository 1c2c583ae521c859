/**
 * @file test_version.cpp
 * @brief Unit tests for version information
 */

#include <gtest/gtest.h>
#include <kcenon/blob_storage/blob_storage.h>

namespace kcenon::blob_storage::test {

class VersionTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(VersionTest, MajorVersionIsCorrect) {
    EXPECT_EQ(version::major, 0);
}

TEST_F(VersionTest, MinorVersionIsCorrect) {
    EXPECT_EQ(version::minor, 1);
}

TEST_F(VersionTest, PatchVersionIsCorrect) {
    EXPECT_EQ(version::patch, 0);
}

TEST_F(VersionTest, VersionStringIsCorrect) {
    EXPECT_EQ(version::to_string(), "0.1.0");
}

TEST_F(VersionTest, UserAgentCarriesLibraryVersion) {
    EXPECT_EQ(std::string(storage_constants::user_agent_version), version::to_string());
}

}  // namespace kcenon::blob_storage::test
