/**
 * @file storage_constants.h
 * @brief Wire-level constants of the blob storage REST protocol
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_STORAGE_CORE_STORAGE_CONSTANTS_H
#define KCENON_BLOB_STORAGE_CORE_STORAGE_CONSTANTS_H

namespace kcenon::blob_storage {

/**
 * @brief Header names used by the pipeline and signers
 */
struct header_names {
    static constexpr const char* authorization = "Authorization";
    static constexpr const char* content_encoding = "Content-Encoding";
    static constexpr const char* content_language = "Content-Language";
    static constexpr const char* content_length = "Content-Length";
    static constexpr const char* content_md5 = "Content-MD5";
    static constexpr const char* content_type = "Content-Type";
    static constexpr const char* if_modified_since = "If-Modified-Since";
    static constexpr const char* if_match = "If-Match";
    static constexpr const char* if_none_match = "If-None-Match";
    static constexpr const char* if_unmodified_since = "If-Unmodified-Since";
    static constexpr const char* range = "Range";
    static constexpr const char* user_agent = "User-Agent";

    static constexpr const char* storage_prefix = "x-ms-";
    static constexpr const char* date = "x-ms-date";
    static constexpr const char* version = "x-ms-version";
    static constexpr const char* client_request_id = "x-ms-client-request-id";
    static constexpr const char* error_code = "x-ms-error-code";
    static constexpr const char* lease_id = "x-ms-lease-id";
};

/**
 * @brief Service protocol constants
 */
struct storage_constants {
    /// Service version sent in x-ms-version and used as the default SAS version
    static constexpr const char* target_storage_version = "2017-04-17";

    static constexpr const char* user_agent_name = "Azure-Storage-Cpp";
    static constexpr const char* user_agent_version = "0.1.0";

    static constexpr const char* default_endpoint_suffix = "core.windows.net";
    static constexpr const char* secondary_account_suffix = "-secondary";

    static constexpr const char* https = "https";
    static constexpr const char* http = "http";
};

}  // namespace kcenon::blob_storage

#endif  // KCENON_BLOB_STORAGE_CORE_STORAGE_CONSTANTS_H
