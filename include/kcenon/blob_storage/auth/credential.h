/**
 * @file credential.h
 * @brief Credential interface and the token/anonymous variants
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_STORAGE_AUTH_CREDENTIAL_H
#define KCENON_BLOB_STORAGE_AUTH_CREDENTIAL_H

#include "kcenon/blob_storage/pipeline/http_policy.h"

#include <memory>
#include <shared_mutex>
#include <string>

namespace kcenon::blob_storage {

/**
 * @brief Source of request authorization
 *
 * A credential contributes exactly one stage to a pipeline. The stage is
 * created once, when the pipeline is built, and shared by every request.
 */
class credential {
public:
    virtual ~credential() = default;

    /**
     * @brief Create the authorization stage for this credential
     */
    [[nodiscard]] virtual auto create_policy() const
        -> std::shared_ptr<const http_policy> = 0;
};

/**
 * @brief Bearer token credential
 *
 * The token can be replaced at any time (e.g. by a refresh loop) while
 * requests are in flight. Requests over plain http are rejected before
 * anything is sent.
 */
class token_credential : public credential {
public:
    explicit token_credential(std::string token);

    /**
     * @brief Replace the token used by subsequent requests
     */
    void set_token(std::string token);

    [[nodiscard]] auto token() const -> std::string;

    [[nodiscard]] auto create_policy() const
        -> std::shared_ptr<const http_policy> override;

    /**
     * @brief Token storage shared with the policies created from this credential
     */
    struct token_state {
        mutable std::shared_mutex mutex;
        std::string token;
    };

private:
    std::shared_ptr<token_state> state_;
};

/**
 * @brief Credential for public resources and pre-signed (SAS) URLs
 */
class anonymous_credential : public credential {
public:
    [[nodiscard]] auto create_policy() const
        -> std::shared_ptr<const http_policy> override;
};

}  // namespace kcenon::blob_storage

#endif  // KCENON_BLOB_STORAGE_AUTH_CREDENTIAL_H
