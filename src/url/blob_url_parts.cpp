/**
 * @file blob_url_parts.cpp
 * @brief Blob URL decomposition and connection string parsing
 * @version 0.1.0
 */

#include "kcenon/blob_storage/url/blob_url_parts.h"
#include "kcenon/blob_storage/core/storage_constants.h"
#include "kcenon/blob_storage/core/storage_utils.h"

#include <algorithm>

namespace kcenon::blob_storage {

namespace {

constexpr const char* snapshot_parameter = "snapshot";

auto trim(std::string_view value) -> std::string_view {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }
    return value;
}

}  // namespace

// ============================================================================
// blob_url_parts
// ============================================================================

auto blob_url_parts::parse(std::string_view url) -> result<blob_url_parts> {
    auto parsed = http_url::parse(url);
    if (!parsed) {
        return unexpected{parsed.error()};
    }
    auto& source = parsed.value();

    blob_url_parts parts;
    parts.scheme = source.scheme;
    parts.host = source.host;
    parts.port = source.port;

    std::string_view path = source.path;
    if (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    if (!path.empty()) {
        auto separator = path.find('/');
        if (separator == std::string_view::npos) {
            parts.container_name = storage_utils::url_decode(path);
        } else {
            parts.container_name = storage_utils::url_decode(path.substr(0, separator));
            parts.blob_name = storage_utils::url_decode(path.substr(separator + 1));
        }
    }

    auto& query = source.query;
    auto snapshot = std::find_if(query.begin(), query.end(), [](const auto& p) {
        return storage_utils::iequals(p.first, snapshot_parameter);
    });
    if (snapshot != query.end()) {
        parts.snapshot = snapshot->second;
        query.erase(std::remove_if(query.begin(), query.end(), [](const auto& p) {
                        return storage_utils::iequals(p.first, snapshot_parameter);
                    }),
                    query.end());
    }

    auto sas = sas_query_parameters::parse(query, true);
    if (!sas.empty()) {
        parts.sas = std::move(sas);
    }
    parts.unparsed_parameters = std::move(query);

    return parts;
}

auto blob_url_parts::to_url() const -> http_url {
    http_url url;
    url.scheme = scheme;
    url.host = host;
    url.port = port;

    if (!container_name.empty()) {
        url.path = "/" + storage_utils::url_encode(container_name);
        if (!blob_name.empty()) {
            url.path += "/" + storage_utils::url_encode(blob_name, false);
        }
    }

    if (!snapshot.empty()) {
        url.add_query(snapshot_parameter, snapshot);
    }
    if (sas) {
        for (auto& [key, value] : sas->to_query_parameters()) {
            url.add_query(std::move(key), std::move(value));
        }
    }
    for (const auto& [key, value] : unparsed_parameters) {
        url.add_query(key, value);
    }
    return url;
}

// ============================================================================
// connection_string
// ============================================================================

auto connection_string::parse(std::string_view value) -> result<connection_string> {
    connection_string parsed;
    std::optional<std::string> explicit_blob_endpoint;

    while (!value.empty()) {
        auto separator = value.find(';');
        auto segment = trim(value.substr(0, separator));
        value = separator == std::string_view::npos ? std::string_view{}
                                                    : value.substr(separator + 1);
        if (segment.empty()) {
            continue;
        }

        auto equals = segment.find('=');
        if (equals == std::string_view::npos || equals == 0) {
            return unexpected{error{error_code::invalid_argument,
                "Malformed connection string entry: " + std::string(segment)}};
        }
        auto key = trim(segment.substr(0, equals));
        auto entry = std::string(trim(segment.substr(equals + 1)));

        if (storage_utils::iequals(key, "AccountName")) {
            parsed.account_name = std::move(entry);
        } else if (storage_utils::iequals(key, "AccountKey")) {
            parsed.account_key = std::move(entry);
        } else if (storage_utils::iequals(key, "DefaultEndpointsProtocol")) {
            parsed.default_endpoints_protocol = storage_utils::to_lower(entry);
        } else if (storage_utils::iequals(key, "EndpointSuffix")) {
            parsed.endpoint_suffix = std::move(entry);
        } else if (storage_utils::iequals(key, "SharedAccessSignature")) {
            if (!entry.empty() && entry.front() == '?') {
                entry.erase(0, 1);
            }
            parsed.shared_access_signature = std::move(entry);
        } else if (storage_utils::iequals(key, "BlobEndpoint")) {
            explicit_blob_endpoint = std::move(entry);
        }
    }

    if (parsed.account_name.empty()) {
        return unexpected{error{error_code::invalid_argument,
            "Connection string has no AccountName"}};
    }
    if (parsed.default_endpoints_protocol != storage_constants::https &&
        parsed.default_endpoints_protocol != storage_constants::http) {
        return unexpected{error{error_code::invalid_argument,
            "Unsupported DefaultEndpointsProtocol: " + parsed.default_endpoints_protocol}};
    }

    const std::string prefix = parsed.default_endpoints_protocol + "://";
    if (explicit_blob_endpoint) {
        parsed.blob_endpoint = std::move(*explicit_blob_endpoint);
    } else {
        parsed.blob_endpoint =
            prefix + parsed.account_name + ".blob." + parsed.endpoint_suffix;
        if (!parsed.account_key.empty()) {
            parsed.secondary_blob_endpoint =
                prefix + parsed.account_name + storage_constants::secondary_account_suffix +
                ".blob." + parsed.endpoint_suffix;
        }
    }
    return parsed;
}

auto connection_string::secondary_host() const -> std::optional<std::string> {
    if (!secondary_blob_endpoint) {
        return std::nullopt;
    }
    auto url = http_url::parse(*secondary_blob_endpoint);
    if (!url) {
        return std::nullopt;
    }
    return url.value().host;
}

}  // namespace kcenon::blob_storage
