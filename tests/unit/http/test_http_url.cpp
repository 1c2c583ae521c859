/**
 * @file test_http_url.cpp
 * @brief Unit tests for absolute URL parsing and rendering
 */

#include <gtest/gtest.h>

#include "kcenon/blob_storage/http/http_url.h"

#include <string>
#include <vector>

namespace kcenon::blob_storage {
namespace {

class HttpUrlTest : public ::testing::Test {};

TEST_F(HttpUrlTest, ParsesComponents) {
    auto url = http_url::parse("HTTPS://acct.blob.core.windows.net:8443/c/b%20x?comp=list&prefix=a%2Fb");
    ASSERT_TRUE(url.has_value());

    const auto& u = url.value();
    EXPECT_EQ(u.scheme, "https");
    EXPECT_EQ(u.host, "acct.blob.core.windows.net");
    ASSERT_TRUE(u.port.has_value());
    EXPECT_EQ(*u.port, 8443);
    EXPECT_EQ(u.path, "/c/b%20x");
    EXPECT_EQ(u.decoded_path(), "/c/b x");
    ASSERT_EQ(u.query.size(), 2u);
    EXPECT_EQ(u.query[1].first, "prefix");
    EXPECT_EQ(u.query[1].second, "a/b");
    EXPECT_TRUE(u.is_https());
}

TEST_F(HttpUrlTest, HostOnly) {
    auto url = http_url::parse("http://127.0.0.1");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url.value().host, "127.0.0.1");
    EXPECT_TRUE(url.value().path.empty());
    EXPECT_FALSE(url.value().port.has_value());
    EXPECT_FALSE(url.value().is_https());
}

TEST_F(HttpUrlTest, Ipv6HostWithPort) {
    auto url = http_url::parse("http://[::1]:10000/devstoreaccount1/c");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url.value().host, "[::1]");
    EXPECT_EQ(*url.value().port, 10000);
    EXPECT_EQ(url.value().path, "/devstoreaccount1/c");
}

TEST_F(HttpUrlTest, FragmentIsDropped) {
    auto url = http_url::parse("https://h/c#frag");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url.value().path, "/c");
}

TEST_F(HttpUrlTest, RejectsMissingScheme) {
    auto url = http_url::parse("acct.blob.core.windows.net/c");
    ASSERT_FALSE(url.has_value());
    EXPECT_EQ(url.error().code, error_code::invalid_url);
}

TEST_F(HttpUrlTest, RejectsMissingHost) {
    EXPECT_FALSE(http_url::parse("https:///c").has_value());
}

TEST_F(HttpUrlTest, RejectsBadPort) {
    EXPECT_FALSE(http_url::parse("https://h:99999/c").has_value());
    EXPECT_FALSE(http_url::parse("https://h:abc/c").has_value());
    EXPECT_FALSE(http_url::parse("https://h:/c").has_value());
}

TEST_F(HttpUrlTest, ToStringEncodesQuery) {
    http_url url;
    url.scheme = "https";
    url.host = "h";
    url.path = "/c";
    url.add_query("se", "2030-01-01T00:00:00Z");
    url.add_query("sig", "a+b/c=");

    EXPECT_EQ(url.to_string(), "https://h/c?se=2030-01-01T00%3A00%3A00Z&sig=a%2Bb%2Fc%3D");
}

TEST_F(HttpUrlTest, ParseDecodesWhatToStringEncoded) {
    http_url url;
    url.scheme = "https";
    url.host = "h";
    url.path = "/c";
    url.add_query("sig", "a+b/c=");

    auto reparsed = http_url::parse(url.to_string());
    ASSERT_TRUE(reparsed.has_value());
    EXPECT_EQ(reparsed.value().query_values("sig"), std::vector<std::string>{"a+b/c="});
}

TEST_F(HttpUrlTest, SetQueryReplacesAllValues) {
    auto url = http_url::parse("https://h/c?a=1&a=2&b=3").value();
    url.set_query("a", "9");

    EXPECT_EQ(url.query_values("a"), std::vector<std::string>{"9"});
    EXPECT_EQ(url.query_values("b"), std::vector<std::string>{"3"});
}

TEST_F(HttpUrlTest, ParameterWithoutValue) {
    auto url = http_url::parse("https://h/c?restype=container&flag");
    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(url.value().query_values("flag"), std::vector<std::string>{""});
}

TEST_F(HttpUrlTest, WithHostKeepsEverythingElse) {
    auto url = http_url::parse("https://acct.blob.core.windows.net/c/b?x=1").value();
    auto secondary = url.with_host("acct-secondary.blob.core.windows.net");

    EXPECT_EQ(secondary.host, "acct-secondary.blob.core.windows.net");
    EXPECT_EQ(secondary.path, url.path);
    EXPECT_EQ(secondary.query, url.query);
    EXPECT_EQ(url.host, "acct.blob.core.windows.net");
}

TEST_F(HttpUrlTest, AuthorityIncludesPort) {
    auto url = http_url::parse("http://127.0.0.1:10000/a").value();
    EXPECT_EQ(url.authority(), "127.0.0.1:10000");
}

}  // namespace
}  // namespace kcenon::blob_storage
