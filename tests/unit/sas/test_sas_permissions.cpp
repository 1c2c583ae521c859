/**
 * @file test_sas_permissions.cpp
 * @brief Unit tests for SAS permission, service and resource type sets
 */

#include <gtest/gtest.h>

#include "kcenon/blob_storage/sas/sas_permissions.h"

namespace kcenon::blob_storage {
namespace {

class SasPermissionsTest : public ::testing::Test {};

TEST_F(SasPermissionsTest, AccountPermissionsUseCanonicalOrder) {
    auto parsed = account_sas_permission::parse("puldwcar");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value().to_string(), "racwdlup");

    auto partial = account_sas_permission::parse("wr");
    ASSERT_TRUE(partial.has_value());
    EXPECT_TRUE(partial.value().read);
    EXPECT_TRUE(partial.value().write);
    EXPECT_FALSE(partial.value().del);
    EXPECT_EQ(partial.value().to_string(), "rw");
}

TEST_F(SasPermissionsTest, ContainerPermissions) {
    auto parsed = container_sas_permission::parse("ldwcar");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value().to_string(), "racwdl");
}

TEST_F(SasPermissionsTest, BlobPermissions) {
    auto parsed = blob_sas_permission::parse("dwcar");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value().to_string(), "racwd");
}

TEST_F(SasPermissionsTest, BlobPermissionsRejectList) {
    auto parsed = blob_sas_permission::parse("rl");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, error_code::invalid_argument);
    EXPECT_NE(parsed.error().message.find("'l'"), std::string::npos);
}

TEST_F(SasPermissionsTest, UnknownPermissionRejected) {
    auto parsed = account_sas_permission::parse("rx");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, error_code::invalid_argument);
}

TEST_F(SasPermissionsTest, DuplicatesCollapse) {
    auto parsed = container_sas_permission::parse("rrr");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value().to_string(), "r");
}

TEST_F(SasPermissionsTest, EmptySetRendersEmpty) {
    auto parsed = account_sas_permission::parse("");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_TRUE(parsed.value().to_string().empty());
}

TEST_F(SasPermissionsTest, Services) {
    auto parsed = account_sas_services::parse("tqfb");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value().to_string(), "bfqt");

    EXPECT_FALSE(account_sas_services::parse("bz").has_value());
}

TEST_F(SasPermissionsTest, ResourceTypes) {
    auto parsed = account_sas_resource_types::parse("ocs");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value().to_string(), "sco");

    auto objects = account_sas_resource_types::parse("o");
    ASSERT_TRUE(objects.has_value());
    EXPECT_TRUE(objects.value().object);
    EXPECT_FALSE(objects.value().service);

    EXPECT_FALSE(account_sas_resource_types::parse("b").has_value());
}

}  // namespace
}  // namespace kcenon::blob_storage
