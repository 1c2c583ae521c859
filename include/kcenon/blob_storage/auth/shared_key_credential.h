/**
 * @file shared_key_credential.h
 * @brief Shared-key canonicalization, HMAC signing and credential
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_STORAGE_AUTH_SHARED_KEY_CREDENTIAL_H
#define KCENON_BLOB_STORAGE_AUTH_SHARED_KEY_CREDENTIAL_H

#include "credential.h"
#include "kcenon/blob_storage/core/types.h"
#include "kcenon/blob_storage/http/http_message.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::blob_storage {

/**
 * @brief Builds the shared-key string-to-sign of a request
 *
 * Layout (lines joined with '\n'):
 * @code
 * VERB
 * Content-Encoding
 * Content-Language
 * Content-Length        (empty when 0)
 * Content-MD5
 * Content-Type
 *                       (Date: always empty, x-ms-date is signed instead)
 * If-Modified-Since
 * If-Match
 * If-None-Match
 * If-Unmodified-Since
 * Range
 * x-ms-a:v              (lower-cased, sorted, one per line)
 * /account/path
 * param:v1,v2           (lower-cased, sorted, values sorted)
 * @endcode
 */
class shared_key_canonicalizer {
public:
    [[nodiscard]] static auto string_to_sign(std::string_view account_name,
                                             const http_request& request) -> std::string;

    /**
     * @brief Sorted x-ms-* header block (may be empty)
     */
    [[nodiscard]] static auto canonicalized_headers(const http_headers& headers) -> std::string;

    /**
     * @brief "/account/path" followed by the sorted query parameter lines
     */
    [[nodiscard]] static auto canonicalized_resource(std::string_view account_name,
                                                     const http_url& url) -> std::string;
};

/**
 * @brief HMAC-SHA256 signer
 */
class shared_key_signer {
public:
    /**
     * @brief Sign with raw key bytes
     * @return Base64 signature, or invalid_key for an empty key
     */
    [[nodiscard]] static auto compute_signature(const std::vector<uint8_t>& key,
                                                std::string_view string_to_sign)
        -> result<std::string>;

    /**
     * @brief Sign with a base64-encoded account key
     * @return Base64 signature, or invalid_key when the key is not strict base64
     */
    [[nodiscard]] static auto compute_signature(std::string_view base64_key,
                                                std::string_view string_to_sign)
        -> result<std::string>;
};

/**
 * @brief Account name and key credential
 *
 * Signs every try with SharedKey authorization. The decoded key bytes never
 * change after construction and are never logged.
 *
 * @code
 * auto cred = shared_key_credential::create("myaccount", account_key_base64);
 * if (!cred) {
 *     // cred.error().code == error_code::invalid_key
 * }
 * @endcode
 */
class shared_key_credential : public credential {
public:
    /**
     * @brief Create a credential from a base64 account key
     * @return Credential, or invalid_key for an empty or malformed key
     */
    [[nodiscard]] static auto create(std::string account_name,
                                     std::string_view base64_key)
        -> result<std::shared_ptr<shared_key_credential>>;

    [[nodiscard]] auto account_name() const -> const std::string& { return account_name_; }

    /**
     * @brief HMAC-SHA256 of @p string_to_sign under the account key, base64 encoded
     */
    [[nodiscard]] auto sign(std::string_view string_to_sign) const -> result<std::string>;

    [[nodiscard]] auto create_policy() const
        -> std::shared_ptr<const http_policy> override;

    shared_key_credential(std::string account_name, std::vector<uint8_t> key);

private:
    std::string account_name_;
    std::vector<uint8_t> key_;
};

}  // namespace kcenon::blob_storage

#endif  // KCENON_BLOB_STORAGE_AUTH_SHARED_KEY_CREDENTIAL_H
