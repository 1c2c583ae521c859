/**
 * @file sas_signature_values.cpp
 * @brief Account and service SAS signing
 * @version 0.1.0
 */

#include "kcenon/blob_storage/sas/sas_signature_values.h"
#include "kcenon/blob_storage/core/logging.h"
#include "kcenon/blob_storage/core/storage_constants.h"
#include "kcenon/blob_storage/core/storage_utils.h"

#include <algorithm>

namespace kcenon::blob_storage {

namespace {

auto time_or_empty(const std::optional<std::chrono::system_clock::time_point>& tp)
    -> std::string {
    return tp ? storage_utils::format_iso8601(*tp) : std::string{};
}

auto protocol_or_empty(const std::optional<sas_protocol>& protocol) -> std::string {
    return protocol ? std::string(to_string(*protocol)) : std::string{};
}

auto version_or_default(const std::string& version) -> std::string {
    return version.empty() ? std::string(storage_constants::target_storage_version) : version;
}

auto join_lines(std::initializer_list<std::string> lines) -> std::string {
    std::string joined;
    bool first = true;
    for (const auto& line : lines) {
        if (!first) {
            joined += '\n';
        }
        joined += line;
        first = false;
    }
    return joined;
}

auto missing(const char* field) -> error {
    return error{error_code::invalid_argument, std::string(field) + " is required"};
}

struct account_fields {
    std::string version;
    std::string permissions;
    std::string services;
    std::string resource_types;
};

auto normalize(const account_sas_values& values) -> result<account_fields> {
    if (values.services.empty()) {
        return unexpected{missing("services")};
    }
    if (values.resource_types.empty()) {
        return unexpected{missing("resource_types")};
    }
    if (values.permissions.empty()) {
        return unexpected{missing("permissions")};
    }
    if (!values.expiry_time) {
        return unexpected{missing("expiry_time")};
    }

    auto permissions = account_sas_permission::parse(values.permissions);
    if (!permissions) {
        return unexpected{permissions.error()};
    }
    auto services = account_sas_services::parse(values.services);
    if (!services) {
        return unexpected{services.error()};
    }
    auto resource_types = account_sas_resource_types::parse(values.resource_types);
    if (!resource_types) {
        return unexpected{resource_types.error()};
    }

    return account_fields{version_or_default(values.version),
                          permissions.value().to_string(),
                          services.value().to_string(),
                          resource_types.value().to_string()};
}

struct service_fields {
    std::string version;
    std::string permissions;
    std::string resource;
};

auto normalize(const service_sas_values& values) -> result<service_fields> {
    if (values.container_name.empty()) {
        return unexpected{missing("container_name")};
    }
    if (values.identifier.empty()) {
        if (values.permissions.empty()) {
            return unexpected{error{error_code::invalid_argument,
                "permissions are required without a stored access policy identifier"}};
        }
        if (!values.expiry_time) {
            return unexpected{error{error_code::invalid_argument,
                "expiry_time is required without a stored access policy identifier"}};
        }
    }

    service_fields fields;
    fields.version = version_or_default(values.version);
    if (values.blob_name.empty()) {
        fields.resource = "c";
        auto permissions = container_sas_permission::parse(values.permissions);
        if (!permissions) {
            return unexpected{permissions.error()};
        }
        fields.permissions = permissions.value().to_string();
    } else {
        fields.resource = "b";
        auto permissions = blob_sas_permission::parse(values.permissions);
        if (!permissions) {
            return unexpected{permissions.error()};
        }
        fields.permissions = permissions.value().to_string();
    }
    return fields;
}

}  // namespace

// ============================================================================
// account_sas_values
// ============================================================================

auto account_sas_values::string_to_sign(const std::string& account_name) const
    -> result<std::string> {
    auto fields = normalize(*this);
    if (!fields) {
        return unexpected{fields.error()};
    }
    const auto& f = fields.value();

    // Account SAS ends with an empty line
    return join_lines({account_name,
                       f.permissions,
                       f.services,
                       f.resource_types,
                       time_or_empty(start_time),
                       time_or_empty(expiry_time),
                       ip_range.to_string(),
                       protocol_or_empty(protocol),
                       f.version,
                       ""});
}

auto account_sas_values::sign(const shared_key_credential& credential) const
    -> result<sas_query_parameters> {
    auto fields = normalize(*this);
    if (!fields) {
        BS_LOG_ERROR(log_category::sas, "Account SAS rejected: " + fields.error().message);
        return unexpected{fields.error()};
    }
    auto to_sign = string_to_sign(credential.account_name());
    if (!to_sign) {
        return unexpected{to_sign.error()};
    }
    auto signature = credential.sign(to_sign.value());
    if (!signature) {
        return unexpected{signature.error()};
    }

    auto f = std::move(fields).value();
    sas_query_parameters params;
    params.version_ = std::move(f.version);
    params.services_ = std::move(f.services);
    params.resource_types_ = std::move(f.resource_types);
    params.protocol_ = protocol_or_empty(protocol);
    params.start_time_ = time_or_empty(start_time);
    params.expiry_time_ = time_or_empty(expiry_time);
    params.ip_range_ = ip_range.to_string();
    params.permissions_ = std::move(f.permissions);
    params.signature_ = std::move(signature).value();
    return params;
}

// ============================================================================
// service_sas_values
// ============================================================================

auto service_sas_values::canonical_name(const std::string& account_name) const -> std::string {
    std::string name = "/blob/" + account_name + "/" + container_name;
    if (!blob_name.empty()) {
        std::string blob = blob_name;
        std::replace(blob.begin(), blob.end(), '\\', '/');
        name += "/" + blob;
    }
    return name;
}

auto service_sas_values::string_to_sign(const std::string& account_name) const
    -> result<std::string> {
    auto fields = normalize(*this);
    if (!fields) {
        return unexpected{fields.error()};
    }
    const auto& f = fields.value();

    return join_lines({f.permissions,
                       time_or_empty(start_time),
                       time_or_empty(expiry_time),
                       canonical_name(account_name),
                       identifier,
                       ip_range.to_string(),
                       protocol_or_empty(protocol),
                       f.version,
                       cache_control,
                       content_disposition,
                       content_encoding,
                       content_language,
                       content_type});
}

auto service_sas_values::sign(const shared_key_credential& credential) const
    -> result<sas_query_parameters> {
    auto fields = normalize(*this);
    if (!fields) {
        BS_LOG_ERROR(log_category::sas, "Service SAS rejected: " + fields.error().message);
        return unexpected{fields.error()};
    }
    auto to_sign = string_to_sign(credential.account_name());
    if (!to_sign) {
        return unexpected{to_sign.error()};
    }
    auto signature = credential.sign(to_sign.value());
    if (!signature) {
        return unexpected{signature.error()};
    }

    auto f = std::move(fields).value();
    sas_query_parameters params;
    params.version_ = std::move(f.version);
    params.protocol_ = protocol_or_empty(protocol);
    params.start_time_ = time_or_empty(start_time);
    params.expiry_time_ = time_or_empty(expiry_time);
    params.ip_range_ = ip_range.to_string();
    params.identifier_ = identifier;
    params.resource_ = std::move(f.resource);
    params.permissions_ = std::move(f.permissions);
    params.cache_control_ = cache_control;
    params.content_disposition_ = content_disposition;
    params.content_encoding_ = content_encoding;
    params.content_language_ = content_language;
    params.content_type_ = content_type;
    params.signature_ = std::move(signature).value();
    return params;
}

}  // namespace kcenon::blob_storage
