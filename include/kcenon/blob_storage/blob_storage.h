/**
 * @file blob_storage.h
 * @brief Main header for blob_storage_system library
 * @version 0.1.0
 *
 * This is the primary include file for the blob_storage_system library.
 * Include this header to access the request pipeline, credentials and SAS
 * builders.
 *
 * @code
 * #include <kcenon/blob_storage/blob_storage.h>
 *
 * using namespace kcenon::blob_storage;
 *
 * auto cred = shared_key_credential::create("myaccount", account_key);
 * auto p = pipeline::create(cred.value());
 *
 * auto url = http_url::parse("https://myaccount.blob.core.windows.net/logs/today.txt");
 * auto response = p.value()->send(http_request(http_method::get, url.value()));
 * @endcode
 */

#ifndef KCENON_BLOB_STORAGE_BLOB_STORAGE_H
#define KCENON_BLOB_STORAGE_BLOB_STORAGE_H

#include <cstdint>
#include <string>

#define BLOB_STORAGE_VERSION_MAJOR 0
#define BLOB_STORAGE_VERSION_MINOR 1
#define BLOB_STORAGE_VERSION_PATCH 0

// Core types
#include "kcenon/blob_storage/core/types.h"
#include "kcenon/blob_storage/core/logging.h"

// HTTP model
#include "kcenon/blob_storage/http/http_headers.h"
#include "kcenon/blob_storage/http/http_message.h"
#include "kcenon/blob_storage/http/http_url.h"
#include "kcenon/blob_storage/http/request_conditions.h"
#include "kcenon/blob_storage/http/request_context.h"

// Pipeline
#include "kcenon/blob_storage/pipeline/pipeline.h"
#include "kcenon/blob_storage/pipeline/pipeline_options.h"
#include "kcenon/blob_storage/transport/http_transport.h"

// Credentials and SAS
#include "kcenon/blob_storage/auth/credential.h"
#include "kcenon/blob_storage/auth/shared_key_credential.h"
#include "kcenon/blob_storage/sas/sas_signature_values.h"
#include "kcenon/blob_storage/url/blob_url_parts.h"

namespace kcenon::blob_storage {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = BLOB_STORAGE_VERSION_MAJOR;
    static constexpr int minor = BLOB_STORAGE_VERSION_MINOR;
    static constexpr int patch = BLOB_STORAGE_VERSION_PATCH;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::blob_storage

#endif  // KCENON_BLOB_STORAGE_BLOB_STORAGE_H
