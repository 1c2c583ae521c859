/**
 * @file blob_url_parts.h
 * @brief Blob URL decomposition and connection string parsing
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_STORAGE_URL_BLOB_URL_PARTS_H
#define KCENON_BLOB_STORAGE_URL_BLOB_URL_PARTS_H

#include "kcenon/blob_storage/core/types.h"
#include "kcenon/blob_storage/http/http_url.h"
#include "kcenon/blob_storage/sas/sas_query_parameters.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::blob_storage {

/**
 * @brief A blob URL split into container, blob, snapshot and SAS parts
 *
 * @code
 * auto parts = blob_url_parts::parse(
 *     "https://acct.blob.core.windows.net/photos/2024/cat.jpg?snapshot=...&sv=...&sig=...");
 * parts.value().container_name;  // "photos"
 * parts.value().blob_name;       // "2024/cat.jpg"
 * parts.value().sas->signature();
 * @endcode
 */
struct blob_url_parts {
    std::string scheme;
    std::string host;
    std::optional<uint16_t> port;

    /// Decoded container name (empty for an account URL)
    std::string container_name;

    /// Decoded blob name; may contain '/'
    std::string blob_name;

    /// Snapshot timestamp, empty for the base blob
    std::string snapshot;

    /// SAS fields found in the query, if any
    std::optional<sas_query_parameters> sas;

    /// Query parameters that are neither snapshot nor SAS
    std::vector<http_url::query_parameter> unparsed_parameters;

    /**
     * @brief Split an absolute URL
     * @return Parts, or invalid_url
     */
    [[nodiscard]] static auto parse(std::string_view url) -> result<blob_url_parts>;

    /**
     * @brief Reassemble; snapshot and SAS precede the unparsed parameters
     */
    [[nodiscard]] auto to_url() const -> http_url;
};

/**
 * @brief Parsed "Key=Value;..." storage connection string
 */
struct connection_string {
    std::string account_name;

    /// Base64 account key; empty for SAS-only strings
    std::string account_key;

    std::string default_endpoints_protocol = "https";
    std::string endpoint_suffix = "core.windows.net";

    /// SAS token without the leading '?'
    std::string shared_access_signature;

    std::string blob_endpoint;

    /// Read replica endpoint; set only for key-based strings
    std::optional<std::string> secondary_blob_endpoint;

    /**
     * @brief Parse a connection string
     * @return Parsed value, or invalid_argument when AccountName is missing
     *         or an entry is malformed
     */
    [[nodiscard]] static auto parse(std::string_view value) -> result<connection_string>;

    /**
     * @brief Host of secondary_blob_endpoint, for retry_options::secondary_host
     */
    [[nodiscard]] auto secondary_host() const -> std::optional<std::string>;
};

}  // namespace kcenon::blob_storage

#endif  // KCENON_BLOB_STORAGE_URL_BLOB_URL_PARTS_H
