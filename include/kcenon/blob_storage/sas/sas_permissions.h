/**
 * @file sas_permissions.h
 * @brief SAS permission, service and resource-type sets
 * @version 0.1.0
 *
 * Each set parses a permission string in any order and renders it in the
 * canonical order the service requires for signing.
 */

#ifndef KCENON_BLOB_STORAGE_SAS_SAS_PERMISSIONS_H
#define KCENON_BLOB_STORAGE_SAS_SAS_PERMISSIONS_H

#include "kcenon/blob_storage/core/types.h"

#include <string>
#include <string_view>

namespace kcenon::blob_storage {

/**
 * @brief Account SAS permissions, canonical order "racwdlup"
 */
struct account_sas_permission {
    bool read = false;
    bool add = false;
    bool create = false;
    bool write = false;
    bool del = false;
    bool list = false;
    bool update = false;
    bool process = false;

    [[nodiscard]] static auto parse(std::string_view value) -> result<account_sas_permission>;
    [[nodiscard]] auto to_string() const -> std::string;
};

/**
 * @brief Container SAS permissions, canonical order "racwdl"
 */
struct container_sas_permission {
    bool read = false;
    bool add = false;
    bool create = false;
    bool write = false;
    bool del = false;
    bool list = false;

    [[nodiscard]] static auto parse(std::string_view value) -> result<container_sas_permission>;
    [[nodiscard]] auto to_string() const -> std::string;
};

/**
 * @brief Blob SAS permissions, canonical order "racwd"
 */
struct blob_sas_permission {
    bool read = false;
    bool add = false;
    bool create = false;
    bool write = false;
    bool del = false;

    [[nodiscard]] static auto parse(std::string_view value) -> result<blob_sas_permission>;
    [[nodiscard]] auto to_string() const -> std::string;
};

/**
 * @brief Services an account SAS applies to, canonical order "bfqt"
 */
struct account_sas_services {
    bool blob = false;
    bool file = false;
    bool queue = false;
    bool table = false;

    [[nodiscard]] static auto parse(std::string_view value) -> result<account_sas_services>;
    [[nodiscard]] auto to_string() const -> std::string;
};

/**
 * @brief Resource types an account SAS applies to, canonical order "sco"
 */
struct account_sas_resource_types {
    bool service = false;
    bool container = false;
    bool object = false;

    [[nodiscard]] static auto parse(std::string_view value) -> result<account_sas_resource_types>;
    [[nodiscard]] auto to_string() const -> std::string;
};

}  // namespace kcenon::blob_storage

#endif  // KCENON_BLOB_STORAGE_SAS_SAS_PERMISSIONS_H
