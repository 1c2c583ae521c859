/**
 * @file sas_signature_values.h
 * @brief Account and service SAS builders
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_STORAGE_SAS_SAS_SIGNATURE_VALUES_H
#define KCENON_BLOB_STORAGE_SAS_SAS_SIGNATURE_VALUES_H

#include "sas_permissions.h"
#include "sas_query_parameters.h"
#include "kcenon/blob_storage/auth/shared_key_credential.h"

#include <chrono>
#include <optional>
#include <string>

namespace kcenon::blob_storage {

/**
 * @brief Builder for an account-level SAS
 *
 * @code
 * account_sas_values values;
 * values.services = "b";
 * values.resource_types = "co";
 * values.permissions = "rl";
 * values.expiry_time = std::chrono::system_clock::now() + std::chrono::hours(1);
 * values.protocol = sas_protocol::https_only;
 *
 * auto sas = values.sign(*credential);
 * if (sas) {
 *     url += "?" + sas.value().encode();
 * }
 * @endcode
 */
class account_sas_values {
public:
    /// Service version; empty selects the library's target version
    std::string version;
    std::optional<sas_protocol> protocol;
    std::optional<std::chrono::system_clock::time_point> start_time;
    std::optional<std::chrono::system_clock::time_point> expiry_time;
    std::string permissions;
    sas_ip_range ip_range;
    std::string services;
    std::string resource_types;

    /**
     * @brief Sign with the account key
     * @return Parameters, or invalid_argument for missing/invalid fields
     */
    [[nodiscard]] auto sign(const shared_key_credential& credential) const
        -> result<sas_query_parameters>;

    /**
     * @brief The string-to-sign sign() would use
     */
    [[nodiscard]] auto string_to_sign(const std::string& account_name) const
        -> result<std::string>;
};

/**
 * @brief Builder for a container or blob SAS
 *
 * The SAS covers the container when blob_name is empty, otherwise the blob.
 * With a stored access policy identifier, permissions and expiry may come
 * from the policy instead.
 */
class service_sas_values {
public:
    std::string version;
    std::optional<sas_protocol> protocol;
    std::optional<std::chrono::system_clock::time_point> start_time;
    std::optional<std::chrono::system_clock::time_point> expiry_time;
    std::string permissions;
    sas_ip_range ip_range;
    std::string container_name;
    std::string blob_name;
    std::string identifier;

    /// Response header overrides (rscc, rscd, rsce, rscl, rsct)
    std::string cache_control;
    std::string content_disposition;
    std::string content_encoding;
    std::string content_language;
    std::string content_type;

    [[nodiscard]] auto sign(const shared_key_credential& credential) const
        -> result<sas_query_parameters>;

    [[nodiscard]] auto string_to_sign(const std::string& account_name) const
        -> result<std::string>;

    /**
     * @brief "/blob/{account}/{container}[/{blob}]"
     */
    [[nodiscard]] auto canonical_name(const std::string& account_name) const -> std::string;
};

}  // namespace kcenon::blob_storage

#endif  // KCENON_BLOB_STORAGE_SAS_SAS_SIGNATURE_VALUES_H
