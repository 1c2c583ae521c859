/**
 * @file test_storage_utils.cpp
 * @brief Unit tests for encoding, crypto and time helpers
 */

#include <gtest/gtest.h>

#include "kcenon/blob_storage/core/storage_utils.h"

#include <chrono>
#include <set>
#include <string>
#include <vector>

namespace kcenon::blob_storage {
namespace {

using namespace std::chrono_literals;

// ============================================================================
// Base64
// ============================================================================

class Base64Test : public ::testing::Test {};

TEST_F(Base64Test, EncodesKnownValues) {
    EXPECT_EQ(storage_utils::base64_encode(std::string("key")), "a2V5");
    EXPECT_EQ(storage_utils::base64_encode(std::string("0123456789abcdef0123456789abcdef")),
              "MDEyMzQ1Njc4OWFiY2RlZjAxMjM0NTY3ODlhYmNkZWY=");
    EXPECT_EQ(storage_utils::base64_encode(std::string("ab")), "YWI=");
    EXPECT_EQ(storage_utils::base64_encode(std::string()), "");
}

TEST_F(Base64Test, DecodesPaddedInput) {
    auto decoded = storage_utils::try_base64_decode("YWI=");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::string(decoded->begin(), decoded->end()), "ab");
}

TEST_F(Base64Test, RejectsBadLength) {
    EXPECT_FALSE(storage_utils::try_base64_decode("abc").has_value());
}

TEST_F(Base64Test, RejectsCharactersOutsideAlphabet) {
    EXPECT_FALSE(storage_utils::try_base64_decode("ab!d").has_value());
    EXPECT_FALSE(storage_utils::try_base64_decode("ab-_").has_value());
}

TEST_F(Base64Test, EmptyDecodesToEmpty) {
    auto decoded = storage_utils::try_base64_decode("");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->empty());
}

// ============================================================================
// URL encoding
// ============================================================================

class UrlEncodingTest : public ::testing::Test {};

TEST_F(UrlEncodingTest, UnreservedCharactersPassThrough) {
    EXPECT_EQ(storage_utils::url_encode("AZaz09-_.~"), "AZaz09-_.~");
}

TEST_F(UrlEncodingTest, ReservedCharactersUseUppercaseHex) {
    EXPECT_EQ(storage_utils::url_encode("a b+c/d=e"), "a%20b%2Bc%2Fd%3De");
}

TEST_F(UrlEncodingTest, SlashCanBePreserved) {
    EXPECT_EQ(storage_utils::url_encode("dir/sub dir/file", false), "dir/sub%20dir/file");
}

TEST_F(UrlEncodingTest, DecodeHandlesMixedCaseHex) {
    EXPECT_EQ(storage_utils::url_decode("a%2fb%2Fc"), "a/b/c");
}

TEST_F(UrlEncodingTest, PlusIsLiteralUnlessRequested) {
    EXPECT_EQ(storage_utils::url_decode("a+b"), "a+b");
    EXPECT_EQ(storage_utils::url_decode("a+b", true), "a b");
}

TEST_F(UrlEncodingTest, MalformedEscapeIsKept) {
    EXPECT_EQ(storage_utils::url_decode("100%zz"), "100%zz");
    EXPECT_EQ(storage_utils::url_decode("50%"), "50%");
}

TEST_F(UrlEncodingTest, DecodeReversesEncode) {
    std::string original = "sr=b&sig=ab+/=";
    EXPECT_EQ(storage_utils::url_decode(storage_utils::url_encode(original)), original);
}

// ============================================================================
// Strings
// ============================================================================

TEST(StringUtilsTest, ToLower) {
    EXPECT_EQ(storage_utils::to_lower("X-MS-Date"), "x-ms-date");
}

TEST(StringUtilsTest, CaseInsensitiveEquality) {
    EXPECT_TRUE(storage_utils::iequals("Content-Type", "content-type"));
    EXPECT_FALSE(storage_utils::iequals("Content-Type", "content-typ"));
    EXPECT_FALSE(storage_utils::iequals("abc", "abd"));
}

// ============================================================================
// HMAC
// ============================================================================

TEST(HmacTest, Sha256KnownVector) {
    std::vector<uint8_t> key{'k', 'e', 'y'};
    auto mac = storage_utils::hmac_sha256(key, "The quick brown fox jumps over the lazy dog");
    ASSERT_EQ(mac.size(), 32u);
    EXPECT_EQ(storage_utils::base64_encode(mac), "97yD9DBThCSxMpjmqm+xQ+9NWaFJRhdZl0edvC0aPNg=");
}

// ============================================================================
// Time
// ============================================================================

class TimeFormatTest : public ::testing::Test {
protected:
    // 2009-10-11T21:49:13Z
    std::chrono::system_clock::time_point sample_ =
        std::chrono::system_clock::time_point(std::chrono::seconds(1255297753));
};

TEST_F(TimeFormatTest, Rfc1123) {
    EXPECT_EQ(storage_utils::format_rfc1123(sample_), "Sun, 11 Oct 2009 21:49:13 GMT");
}

TEST_F(TimeFormatTest, Iso8601DropsFractionalSeconds) {
    EXPECT_EQ(storage_utils::format_iso8601(sample_ + 250ms), "2009-10-11T21:49:13Z");
}

TEST_F(TimeFormatTest, CurrentTimeIsRfc1123Shaped) {
    auto now = storage_utils::get_rfc1123_time();
    ASSERT_EQ(now.size(), 29u);
    EXPECT_EQ(now.substr(now.size() - 4), " GMT");
    EXPECT_EQ(now[3], ',');
}

// ============================================================================
// Random and XML
// ============================================================================

TEST(UuidTest, Version4Layout) {
    auto uuid = storage_utils::generate_uuid();
    ASSERT_EQ(uuid.size(), 36u);
    EXPECT_EQ(uuid[8], '-');
    EXPECT_EQ(uuid[13], '-');
    EXPECT_EQ(uuid[14], '4');
    EXPECT_EQ(uuid[18], '-');
    EXPECT_EQ(uuid[23], '-');
    EXPECT_NE(std::string("89ab").find(uuid[19]), std::string::npos);
}

TEST(UuidTest, ValuesAreUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        seen.insert(storage_utils::generate_uuid());
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST(XmlTest, ExtractsFirstElement) {
    const std::string body =
        "<?xml version=\"1.0\"?><Error><Code>ContainerNotFound</Code>"
        "<Message>The specified container does not exist.</Message></Error>";
    auto code = storage_utils::extract_xml_element(body, "Code");
    ASSERT_TRUE(code.has_value());
    EXPECT_EQ(*code, "ContainerNotFound");
}

TEST(XmlTest, MissingElement) {
    EXPECT_FALSE(storage_utils::extract_xml_element("<Error></Error>", "Code").has_value());
    EXPECT_FALSE(storage_utils::extract_xml_element("<Code>open", "Code").has_value());
}

}  // namespace
}  // namespace kcenon::blob_storage
