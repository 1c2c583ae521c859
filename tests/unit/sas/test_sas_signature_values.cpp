/**
 * @file test_sas_signature_values.cpp
 * @brief Unit tests for account and service SAS signing and query encoding
 */

#include <gtest/gtest.h>

#include "kcenon/blob_storage/auth/shared_key_credential.h"
#include "kcenon/blob_storage/sas/sas_signature_values.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::blob_storage::test {

namespace {

constexpr const char* account_key = "MDEyMzQ1Njc4OWFiY2RlZjAxMjM0NTY3ODlhYmNkZWY=";

// 2030-01-01T00:00:00Z
const auto expiry = std::chrono::system_clock::time_point(std::chrono::seconds(1893456000));

}  // namespace

class SasSignatureTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto cred = shared_key_credential::create("myaccount", account_key);
        ASSERT_TRUE(cred.has_value());
        credential_ = cred.value();
    }

    static auto account_values() -> account_sas_values {
        account_sas_values values;
        values.permissions = "wr";
        values.services = "b";
        values.resource_types = "sco";
        values.expiry_time = expiry;
        return values;
    }

    static auto blob_values() -> service_sas_values {
        service_sas_values values;
        values.container_name = "photos";
        values.blob_name = "2024/cat.jpg";
        values.permissions = "r";
        values.protocol = sas_protocol::https_only;
        values.expiry_time = expiry;
        values.content_type = "image/jpeg";
        return values;
    }

    std::shared_ptr<shared_key_credential> credential_;
};

// ============================================================================
// Account SAS
// ============================================================================

TEST_F(SasSignatureTest, AccountStringToSign) {
    auto to_sign = account_values().string_to_sign("myaccount");
    ASSERT_TRUE(to_sign.has_value());
    EXPECT_EQ(to_sign.value(),
              "myaccount\nrw\nb\nsco\n\n2030-01-01T00:00:00Z\n\n\n2017-04-17\n");
}

TEST_F(SasSignatureTest, AccountSasKnownSignature) {
    auto params = account_values().sign(*credential_);
    ASSERT_TRUE(params.has_value());

    const auto& p = params.value();
    EXPECT_EQ(p.version(), "2017-04-17");
    EXPECT_EQ(p.permissions(), "rw");
    EXPECT_EQ(p.services(), "b");
    EXPECT_EQ(p.resource_types(), "sco");
    EXPECT_EQ(p.expiry_time(), "2030-01-01T00:00:00Z");
    EXPECT_TRUE(p.protocol().empty());
    EXPECT_EQ(p.signature(), "QR6NK9JqT/mTSbqcAKFoHmYf/B+U5ei+qwLqz8syZOA=");
}

TEST_F(SasSignatureTest, AccountSasEncodedQuery) {
    auto params = account_values().sign(*credential_);
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(params.value().encode(),
              "sv=2017-04-17&ss=b&srt=sco&se=2030-01-01T00%3A00%3A00Z&sp=rw"
              "&sig=QR6NK9JqT%2FmTSbqcAKFoHmYf%2FB%2BU5ei%2BqwLqz8syZOA%3D");
}

TEST_F(SasSignatureTest, AccountSasIsDeterministic) {
    auto a = account_values().sign(*credential_);
    auto b = account_values().sign(*credential_);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a.value().encode(), b.value().encode());
}

TEST_F(SasSignatureTest, AccountSasRequiresFields) {
    auto no_services = account_values();
    no_services.services.clear();
    auto a = no_services.sign(*credential_);
    ASSERT_FALSE(a.has_value());
    EXPECT_EQ(a.error().code, error_code::invalid_argument);
    EXPECT_NE(a.error().message.find("services"), std::string::npos);

    auto no_expiry = account_values();
    no_expiry.expiry_time.reset();
    EXPECT_FALSE(no_expiry.sign(*credential_).has_value());

    auto no_permissions = account_values();
    no_permissions.permissions.clear();
    EXPECT_FALSE(no_permissions.sign(*credential_).has_value());
}

TEST_F(SasSignatureTest, AccountSasRejectsUnknownPermission) {
    auto values = account_values();
    values.permissions = "rz";
    auto params = values.sign(*credential_);
    ASSERT_FALSE(params.has_value());
    EXPECT_EQ(params.error().code, error_code::invalid_argument);
}

TEST_F(SasSignatureTest, OptionalFieldsAppearInStringToSign) {
    auto values = account_values();
    values.start_time = expiry - std::chrono::hours(24);
    values.ip_range = sas_ip_range{"168.1.5.60", "168.1.5.70"};
    values.protocol = sas_protocol::https_http;
    values.version = "2018-03-28";

    auto to_sign = values.string_to_sign("myaccount");
    ASSERT_TRUE(to_sign.has_value());
    EXPECT_EQ(to_sign.value(),
              "myaccount\nrw\nb\nsco\n2029-12-31T00:00:00Z\n2030-01-01T00:00:00Z\n"
              "168.1.5.60-168.1.5.70\nhttps,http\n2018-03-28\n");
}

// ============================================================================
// Service SAS
// ============================================================================

TEST_F(SasSignatureTest, CanonicalNames) {
    service_sas_values values;
    values.container_name = "photos";
    EXPECT_EQ(values.canonical_name("myaccount"), "/blob/myaccount/photos");

    values.blob_name = "2024\\cat.jpg";
    EXPECT_EQ(values.canonical_name("myaccount"), "/blob/myaccount/photos/2024/cat.jpg");
}

TEST_F(SasSignatureTest, BlobSasKnownSignature) {
    auto params = blob_values().sign(*credential_);
    ASSERT_TRUE(params.has_value());

    const auto& p = params.value();
    EXPECT_EQ(p.resource(), "b");
    EXPECT_EQ(p.protocol(), "https");
    EXPECT_EQ(p.content_type(), "image/jpeg");
    EXPECT_EQ(p.signature(), "WTi8GuJZSrEwq46OGydRx1xJxQaMoapBixxDErzYDMU=");
    EXPECT_EQ(p.encode(),
              "sv=2017-04-17&spr=https&se=2030-01-01T00%3A00%3A00Z&sr=b&sp=r"
              "&rsct=image%2Fjpeg&sig=WTi8GuJZSrEwq46OGydRx1xJxQaMoapBixxDErzYDMU%3D");
}

TEST_F(SasSignatureTest, ContainerSasUsesContainerResource) {
    auto values = blob_values();
    values.blob_name.clear();
    values.permissions = "lr";

    auto params = values.sign(*credential_);
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(params.value().resource(), "c");
    EXPECT_EQ(params.value().permissions(), "rl");
}

TEST_F(SasSignatureTest, BlobSasRejectsContainerOnlyPermission) {
    auto values = blob_values();
    values.permissions = "rl";
    EXPECT_FALSE(values.sign(*credential_).has_value());
}

TEST_F(SasSignatureTest, ServiceSasRequiresContainer) {
    auto values = blob_values();
    values.container_name.clear();
    auto params = values.sign(*credential_);
    ASSERT_FALSE(params.has_value());
    EXPECT_EQ(params.error().code, error_code::invalid_argument);
}

TEST_F(SasSignatureTest, StoredPolicyIdentifierReplacesPermissionsAndExpiry) {
    service_sas_values values;
    values.container_name = "photos";
    values.identifier = "read-only-policy";

    auto params = values.sign(*credential_);
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(params.value().identifier(), "read-only-policy");
    EXPECT_TRUE(params.value().permissions().empty());
    EXPECT_TRUE(params.value().expiry_time().empty());
}

TEST_F(SasSignatureTest, ServiceSasWithoutIdentifierNeedsExpiry) {
    auto values = blob_values();
    values.expiry_time.reset();
    EXPECT_FALSE(values.sign(*credential_).has_value());
}

TEST_F(SasSignatureTest, ServiceStringToSignCarriesOverrides) {
    auto values = blob_values();
    values.cache_control = "no-cache";
    values.content_disposition = "attachment";
    values.content_encoding = "gzip";
    values.content_language = "en";

    auto to_sign = values.string_to_sign("myaccount");
    ASSERT_TRUE(to_sign.has_value());
    EXPECT_EQ(to_sign.value(),
              "r\n\n2030-01-01T00:00:00Z\n/blob/myaccount/photos/2024/cat.jpg\n\n\nhttps\n"
              "2017-04-17\nno-cache\nattachment\ngzip\nen\nimage/jpeg");
}

// ============================================================================
// sas_ip_range / sas_query_parameters
// ============================================================================

TEST_F(SasSignatureTest, IpRangeRendering) {
    EXPECT_EQ(sas_ip_range{}.to_string(), "");
    EXPECT_EQ((sas_ip_range{"10.0.0.1", ""}.to_string()), "10.0.0.1");
    EXPECT_EQ((sas_ip_range{"10.0.0.1", "10.0.0.1"}.to_string()), "10.0.0.1");
    EXPECT_EQ((sas_ip_range{"10.0.0.1", "10.0.0.9"}.to_string()), "10.0.0.1-10.0.0.9");
}

TEST_F(SasSignatureTest, ParseExtractsSasFields) {
    std::vector<http_url::query_parameter> query{
        {"comp", "list"}, {"sv", "2017-04-17"}, {"SP", "r"}, {"sig", "abc="}, {"sv", "ignored"}};

    auto params = sas_query_parameters::parse(query, false);
    EXPECT_FALSE(params.empty());
    EXPECT_EQ(params.version(), "2017-04-17");
    EXPECT_EQ(params.permissions(), "r");
    EXPECT_EQ(params.signature(), "abc=");
    EXPECT_EQ(query.size(), 5u);
}

TEST_F(SasSignatureTest, ParseCanRemoveSasFields) {
    std::vector<http_url::query_parameter> query{
        {"comp", "list"}, {"sv", "2017-04-17"}, {"sig", "abc="}};

    auto params = sas_query_parameters::parse(query, true);
    EXPECT_EQ(params.signature(), "abc=");
    ASSERT_EQ(query.size(), 1u);
    EXPECT_EQ(query[0].first, "comp");
}

TEST_F(SasSignatureTest, ParseWithoutSasIsEmpty) {
    std::vector<http_url::query_parameter> query{{"comp", "list"}};
    auto params = sas_query_parameters::parse(query, true);
    EXPECT_TRUE(params.empty());
    EXPECT_EQ(params.encode(), "");
    EXPECT_EQ(query.size(), 1u);
}

}  // namespace kcenon::blob_storage::test
