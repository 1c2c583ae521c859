/**
 * @file test_credentials.cpp
 * @brief Unit tests for shared-key, token and anonymous credentials
 */

#include <gtest/gtest.h>

#include "kcenon/blob_storage/auth/credential.h"
#include "kcenon/blob_storage/auth/shared_key_credential.h"
#include "kcenon/blob_storage/core/logging.h"
#include "kcenon/blob_storage/pipeline/pipeline.h"
#include "mock_transport.h"

#include <memory>
#include <mutex>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::blob_storage::test {

namespace {

constexpr const char* account_key = "MDEyMzQ1Njc4OWFiY2RlZjAxMjM0NTY3ODlhYmNkZWY=";

struct captured_log {
    log_level level;
    std::string category;
    std::string message;
};

}  // namespace

class CredentialTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<mock_transport>();
        get_logger().set_callback([this](log_level level, std::string_view category,
                                         std::string_view message, const request_log_context*) {
            std::lock_guard<std::mutex> lock(logs_mutex_);
            logs_.push_back({level, std::string(category), std::string(message)});
        });
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
    }

    auto make_pipeline(const std::shared_ptr<const credential>& cred) -> std::shared_ptr<pipeline> {
        auto options = pipeline_options_builder()
                           .with_transport(transport_)
                           .with_retry_delay(std::chrono::milliseconds(1),
                                             std::chrono::milliseconds(5))
                           .build();
        EXPECT_TRUE(options.has_value());
        auto p = pipeline::create(cred, options.value());
        EXPECT_TRUE(p.has_value());
        return p.value();
    }

    auto logs_in(std::string_view category) -> std::vector<captured_log> {
        std::lock_guard<std::mutex> lock(logs_mutex_);
        std::vector<captured_log> matching;
        for (const auto& entry : logs_) {
            if (entry.category == category) {
                matching.push_back(entry);
            }
        }
        return matching;
    }

    std::shared_ptr<mock_transport> transport_;
    std::mutex logs_mutex_;
    std::vector<captured_log> logs_;
};

// ============================================================================
// shared_key_credential
// ============================================================================

TEST_F(CredentialTest, SharedKeyCreateAcceptsValidKey) {
    auto cred = shared_key_credential::create("myaccount", account_key);
    ASSERT_TRUE(cred.has_value());
    EXPECT_EQ(cred.value()->account_name(), "myaccount");
}

TEST_F(CredentialTest, SharedKeyCreateRejectsInvalidBase64) {
    auto cred = shared_key_credential::create("myaccount", "%%%not-base64%%%");
    ASSERT_FALSE(cred.has_value());
    EXPECT_EQ(cred.error().code, error_code::invalid_key);
}

TEST_F(CredentialTest, SharedKeyCreateRejectsEmptyKey) {
    auto cred = shared_key_credential::create("myaccount", "");
    ASSERT_FALSE(cred.has_value());
    EXPECT_EQ(cred.error().code, error_code::invalid_key);
}

TEST_F(CredentialTest, SharedKeyCreateRejectsEmptyAccount) {
    auto cred = shared_key_credential::create("", account_key);
    ASSERT_FALSE(cred.has_value());
    EXPECT_EQ(cred.error().code, error_code::invalid_argument);
}

TEST_F(CredentialTest, SharedKeyAuthorizationMatchesCanonicalSignature) {
    auto cred = shared_key_credential::create("myaccount", account_key);
    ASSERT_TRUE(cred.has_value());

    auto p = make_pipeline(cred.value());
    auto response = p->send(make_request(
        http_method::get, "https://myaccount.blob.core.windows.net/logs/today.txt?timeout=30"));
    ASSERT_TRUE(response.has_value());

    auto calls = transport_->calls();
    ASSERT_EQ(calls.size(), 1u);
    const auto& sent = calls[0].request;

    auto expected_signature = cred.value()->sign(
        shared_key_canonicalizer::string_to_sign("myaccount", sent));
    ASSERT_TRUE(expected_signature.has_value());
    EXPECT_EQ(sent.headers.get_or_empty(header_names::authorization),
              "SharedKey myaccount:" + expected_signature.value());
}

TEST_F(CredentialTest, SharedKeySignsEveryTryAfterDateRefresh) {
    auto cred = shared_key_credential::create("myaccount", account_key);
    ASSERT_TRUE(cred.has_value());
    transport_->enqueue_response(503);
    transport_->enqueue_response(200);

    auto p = make_pipeline(cred.value());
    ASSERT_TRUE(p->send(make_request(http_method::get,
                                     "https://myaccount.blob.core.windows.net/c/b")).has_value());

    for (const auto& call : transport_->calls()) {
        ASSERT_TRUE(call.request.headers.contains(header_names::date));
        auto expected = cred.value()->sign(
            shared_key_canonicalizer::string_to_sign("myaccount", call.request));
        ASSERT_TRUE(expected.has_value());
        EXPECT_EQ(call.request.headers.get_or_empty(header_names::authorization),
                  "SharedKey myaccount:" + expected.value());
    }
}

TEST_F(CredentialTest, SharedKeySigningIsReentrant) {
    auto cred = shared_key_credential::create("myaccount", account_key);
    ASSERT_TRUE(cred.has_value());
    const std::string to_sign = "GET\n\n\n\n\n\n\n\n\n\n\n\n/myaccount/c/b";
    auto reference = cred.value()->sign(to_sign);
    ASSERT_TRUE(reference.has_value());

    std::atomic<int> mismatches{0};
    std::vector<std::thread> signers;
    for (int t = 0; t < 8; ++t) {
        signers.emplace_back([&]() {
            for (int i = 0; i < 200; ++i) {
                auto signature = cred.value()->sign(to_sign);
                if (!signature || signature.value() != reference.value()) {
                    mismatches.fetch_add(1);
                }
            }
        });
    }
    for (auto& signer : signers) {
        signer.join();
    }
    EXPECT_EQ(mismatches.load(), 0);
}

TEST_F(CredentialTest, SharedKeyConcurrentSendsAreSignedIndependently) {
    auto cred = shared_key_credential::create("myaccount", account_key);
    ASSERT_TRUE(cred.has_value());
    auto p = make_pipeline(cred.value());

    std::vector<std::thread> senders;
    for (int t = 0; t < 4; ++t) {
        senders.emplace_back([&p, t]() {
            for (int i = 0; i < 25; ++i) {
                auto url = "https://myaccount.blob.core.windows.net/c/blob-" +
                           std::to_string(t) + "-" + std::to_string(i);
                EXPECT_TRUE(p->send(make_request(http_method::get, url)).has_value());
            }
        });
    }
    for (auto& sender : senders) {
        sender.join();
    }

    auto calls = transport_->calls();
    ASSERT_EQ(calls.size(), 100u);
    for (const auto& call : calls) {
        auto expected = cred.value()->sign(
            shared_key_canonicalizer::string_to_sign("myaccount", call.request));
        ASSERT_TRUE(expected.has_value());
        EXPECT_EQ(call.request.headers.get_or_empty(header_names::authorization),
                  "SharedKey myaccount:" + expected.value());
    }
}

TEST_F(CredentialTest, SharedKeyForbiddenLogsStringToSign) {
    auto cred = shared_key_credential::create("myaccount", account_key);
    ASSERT_TRUE(cred.has_value());
    transport_->enqueue_response(403);

    auto response = make_pipeline(cred.value())->send(
        make_request(http_method::get, "https://myaccount.blob.core.windows.net/c/b"));
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response.value().status_code, 403);

    auto auth_logs = logs_in(log_category::auth);
    ASSERT_EQ(auth_logs.size(), 1u);
    EXPECT_EQ(auth_logs[0].level, log_level::error);
    EXPECT_EQ(auth_logs[0].message.rfind("HTTP Forbidden status, String-to-Sign:", 0), 0u);
    EXPECT_NE(auth_logs[0].message.find("/myaccount/c/b"), std::string::npos);
}

TEST_F(CredentialTest, SharedKeyPolicyNameIsStable) {
    auto cred = shared_key_credential::create("myaccount", account_key);
    ASSERT_TRUE(cred.has_value());
    EXPECT_EQ(cred.value()->create_policy()->name(), "shared_key");
}

// ============================================================================
// token_credential
// ============================================================================

TEST_F(CredentialTest, TokenSetsBearerAuthorization) {
    auto cred = std::make_shared<token_credential>("token-one");
    auto p = make_pipeline(cred);

    ASSERT_TRUE(p->send(make_request(http_method::get,
                                     "https://acct.blob.core.windows.net/c/b")).has_value());

    auto calls = transport_->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].request.headers.get_or_empty(header_names::authorization),
              "Bearer token-one");
}

TEST_F(CredentialTest, TokenRefreshAppliesToLaterRequests) {
    auto cred = std::make_shared<token_credential>("token-one");
    auto p = make_pipeline(cred);

    ASSERT_TRUE(p->send(make_request(http_method::get,
                                     "https://acct.blob.core.windows.net/c/b")).has_value());
    cred->set_token("token-two");
    EXPECT_EQ(cred->token(), "token-two");
    ASSERT_TRUE(p->send(make_request(http_method::get,
                                     "https://acct.blob.core.windows.net/c/b")).has_value());

    auto calls = transport_->calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].request.headers.get_or_empty(header_names::authorization),
              "Bearer token-one");
    EXPECT_EQ(calls[1].request.headers.get_or_empty(header_names::authorization),
              "Bearer token-two");
}

TEST_F(CredentialTest, TokenRotationIsAtomicUnderConcurrentSends) {
    const std::string first(256, 'a');
    const std::string second(256, 'b');
    auto cred = std::make_shared<token_credential>(first);
    auto p = make_pipeline(cred);

    constexpr int sender_count = 4;
    constexpr int sends_per_thread = 50;
    std::atomic<bool> done{false};
    std::atomic<int> failures{0};

    std::thread rotator([&]() {
        bool use_second = true;
        while (!done.load()) {
            cred->set_token(use_second ? second : first);
            use_second = !use_second;
        }
    });

    std::vector<std::thread> senders;
    for (int t = 0; t < sender_count; ++t) {
        senders.emplace_back([&]() {
            for (int i = 0; i < sends_per_thread; ++i) {
                if (!p->send(make_request(http_method::get,
                                          "https://acct.blob.core.windows.net/c/b"))) {
                    failures.fetch_add(1);
                }
            }
        });
    }
    for (auto& sender : senders) {
        sender.join();
    }
    done.store(true);
    rotator.join();

    EXPECT_EQ(failures.load(), 0);
    auto calls = transport_->calls();
    ASSERT_EQ(calls.size(), static_cast<size_t>(sender_count * sends_per_thread));
    for (const auto& call : calls) {
        auto authorization = call.request.headers.get_or_empty(header_names::authorization);
        EXPECT_TRUE(authorization == "Bearer " + first || authorization == "Bearer " + second)
            << "unexpected Authorization of length " << authorization.size();
    }
}

TEST_F(CredentialTest, TokenRejectsPlainHttpBeforeSending) {
    auto cred = std::make_shared<token_credential>("secret");
    auto response = make_pipeline(cred)->send(
        make_request(http_method::get, "http://acct.blob.core.windows.net/c/b"));

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, error_code::invalid_argument);
    EXPECT_EQ(transport_->call_count(), 0u);
    EXPECT_FALSE(logs_in(log_category::auth).empty());
}

// ============================================================================
// anonymous_credential
// ============================================================================

TEST_F(CredentialTest, AnonymousSendsNoAuthorization) {
    auto p = make_pipeline(std::make_shared<anonymous_credential>());

    ASSERT_TRUE(p->send(make_request(http_method::get,
                                     "https://acct.blob.core.windows.net/c/b?sv=2017-04-17&sig=abc"))
                    .has_value());

    auto calls = transport_->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_FALSE(calls[0].request.headers.contains(header_names::authorization));
    EXPECT_EQ(calls[0].request.url.query_values("sig"), std::vector<std::string>{"abc"});
}

TEST_F(CredentialTest, AnonymousAllowsPlainHttp) {
    auto p = make_pipeline(std::make_shared<anonymous_credential>());
    auto response = p->send(make_request(http_method::get, "http://127.0.0.1:10000/c/b"));
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(transport_->call_count(), 1u);
}

}  // namespace kcenon::blob_storage::test
