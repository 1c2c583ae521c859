/**
 * @file credential.cpp
 * @brief Token and anonymous credentials
 * @version 0.1.0
 */

#include "kcenon/blob_storage/auth/credential.h"
#include "kcenon/blob_storage/core/logging.h"
#include "kcenon/blob_storage/core/storage_constants.h"

#include <mutex>

namespace kcenon::blob_storage {

namespace {

class token_policy : public http_policy {
public:
    explicit token_policy(std::shared_ptr<const token_credential::token_state> state)
        : state_(std::move(state)) {}

    [[nodiscard]] auto send(http_request& request,
                            const next_policy& next,
                            const request_context& context) const
        -> result<http_response> override {
        if (request.url.scheme != storage_constants::https) {
            BS_LOG_ERROR(log_category::auth,
                         "Token credentials require an https URL, got scheme '" +
                         request.url.scheme + "'");
            return unexpected{error{error_code::invalid_argument,
                "Token credentials require a URL using the https protocol scheme"}};
        }

        std::string token;
        {
            std::shared_lock lock(state_->mutex);
            token = state_->token;
        }
        request.headers.set(header_names::authorization, "Bearer " + token);
        return next.send(request, context);
    }

    [[nodiscard]] auto name() const -> std::string_view override { return "token"; }

private:
    std::shared_ptr<const token_credential::token_state> state_;
};

class anonymous_policy : public http_policy {
public:
    [[nodiscard]] auto send(http_request& request,
                            const next_policy& next,
                            const request_context& context) const
        -> result<http_response> override {
        return next.send(request, context);
    }

    [[nodiscard]] auto name() const -> std::string_view override { return "anonymous"; }
};

}  // namespace

// ============================================================================
// token_credential
// ============================================================================

token_credential::token_credential(std::string token)
    : state_(std::make_shared<token_state>()) {
    state_->token = std::move(token);
}

void token_credential::set_token(std::string token) {
    std::unique_lock lock(state_->mutex);
    state_->token = std::move(token);
}

auto token_credential::token() const -> std::string {
    std::shared_lock lock(state_->mutex);
    return state_->token;
}

auto token_credential::create_policy() const -> std::shared_ptr<const http_policy> {
    return std::make_shared<token_policy>(state_);
}

// ============================================================================
// anonymous_credential
// ============================================================================

auto anonymous_credential::create_policy() const -> std::shared_ptr<const http_policy> {
    return std::make_shared<anonymous_policy>();
}

}  // namespace kcenon::blob_storage
