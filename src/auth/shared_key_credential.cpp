/**
 * @file shared_key_credential.cpp
 * @brief Shared-key canonicalization, signing and authorization stage
 * @version 0.1.0
 */

#include "kcenon/blob_storage/auth/shared_key_credential.h"
#include "kcenon/blob_storage/core/logging.h"
#include "kcenon/blob_storage/core/storage_constants.h"
#include "kcenon/blob_storage/core/storage_utils.h"

#include <algorithm>
#include <map>

namespace kcenon::blob_storage {

namespace {

auto starts_with(std::string_view value, std::string_view prefix) -> bool {
    return value.size() >= prefix.size() && value.substr(0, prefix.size()) == prefix;
}

/**
 * @brief Stage that signs each try with SharedKey authorization
 */
class shared_key_policy : public http_policy {
public:
    shared_key_policy(std::string account_name, std::vector<uint8_t> key)
        : account_name_(std::move(account_name)), key_(std::move(key)) {}

    [[nodiscard]] auto send(http_request& request,
                            const next_policy& next,
                            const request_context& context) const
        -> result<http_response> override {
        if (!request.headers.contains(header_names::date)) {
            request.headers.set(header_names::date, storage_utils::get_rfc1123_time());
        }

        auto string_to_sign = shared_key_canonicalizer::string_to_sign(account_name_, request);
        auto signature = shared_key_signer::compute_signature(key_, string_to_sign);
        if (!signature) {
            return unexpected{signature.error()};
        }
        request.headers.set(header_names::authorization,
                            "SharedKey " + account_name_ + ":" + signature.value());

        auto outcome = next.send(request, context);
        if (outcome && outcome.value().status_code == 403) {
            BS_LOG_ERROR(log_category::auth,
                         "HTTP Forbidden status, String-to-Sign:\n'" + string_to_sign + "'");
        }
        return outcome;
    }

    [[nodiscard]] auto name() const -> std::string_view override { return "shared_key"; }

private:
    std::string account_name_;
    std::vector<uint8_t> key_;
};

}  // namespace

// ============================================================================
// shared_key_canonicalizer
// ============================================================================

auto shared_key_canonicalizer::string_to_sign(std::string_view account_name,
                                              const http_request& request) -> std::string {
    const auto& headers = request.headers;

    std::string content_length = headers.get_or_empty(header_names::content_length);
    if (!headers.contains(header_names::content_length) && request.body_size() > 0) {
        content_length = std::to_string(request.body_size());
    }
    if (content_length == "0") {
        content_length.clear();
    }

    std::string result;
    result.reserve(256);
    auto append_line = [&result](std::string_view line) {
        result.append(line);
        result.push_back('\n');
    };

    append_line(request.method);
    append_line(headers.get_or_empty(header_names::content_encoding));
    append_line(headers.get_or_empty(header_names::content_language));
    append_line(content_length);
    append_line(headers.get_or_empty(header_names::content_md5));
    append_line(headers.get_or_empty(header_names::content_type));
    append_line("");
    append_line(headers.get_or_empty(header_names::if_modified_since));
    append_line(headers.get_or_empty(header_names::if_match));
    append_line(headers.get_or_empty(header_names::if_none_match));
    append_line(headers.get_or_empty(header_names::if_unmodified_since));
    append_line(headers.get_or_empty(header_names::range));
    append_line(canonicalized_headers(headers));
    result.append(canonicalized_resource(account_name, request.url));

    return result;
}

auto shared_key_canonicalizer::canonicalized_headers(const http_headers& headers)
    -> std::string {
    std::map<std::string, std::string> storage_headers;
    for (const auto& [name, value] : headers) {
        auto lowered = storage_utils::to_lower(name);
        if (!starts_with(lowered, header_names::storage_prefix)) {
            continue;
        }
        auto [it, inserted] = storage_headers.try_emplace(std::move(lowered), value);
        if (!inserted) {
            it->second += ',';
            it->second += value;
        }
    }

    std::string block;
    for (const auto& [name, value] : storage_headers) {
        if (!block.empty()) {
            block += '\n';
        }
        block += name;
        block += ':';
        block += value;
    }
    return block;
}

auto shared_key_canonicalizer::canonicalized_resource(std::string_view account_name,
                                                      const http_url& url) -> std::string {
    std::string resource = "/";
    resource += account_name;

    auto path = url.decoded_path();
    resource += path.empty() ? "/" : path;

    std::map<std::string, std::vector<std::string>> parameters;
    for (const auto& [key, value] : url.query) {
        parameters[storage_utils::to_lower(key)].push_back(value);
    }

    for (auto& [key, values] : parameters) {
        std::sort(values.begin(), values.end());
        resource += '\n';
        resource += key;
        resource += ':';
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (i > 0) {
                resource += ',';
            }
            resource += values[i];
        }
    }
    return resource;
}

// ============================================================================
// shared_key_signer
// ============================================================================

auto shared_key_signer::compute_signature(const std::vector<uint8_t>& key,
                                          std::string_view string_to_sign)
    -> result<std::string> {
    if (key.empty()) {
        return unexpected{error{error_code::invalid_key, "Account key is empty"}};
    }
    auto mac = storage_utils::hmac_sha256(key, string_to_sign);
    if (mac.empty()) {
        return unexpected{error{error_code::internal_error, "HMAC-SHA256 computation failed"}};
    }
    return storage_utils::base64_encode(mac);
}

auto shared_key_signer::compute_signature(std::string_view base64_key,
                                          std::string_view string_to_sign)
    -> result<std::string> {
    auto key = storage_utils::try_base64_decode(base64_key);
    if (!key) {
        return unexpected{error{error_code::invalid_key,
            "Account key is not valid base64"}};
    }
    return compute_signature(*key, string_to_sign);
}

// ============================================================================
// shared_key_credential
// ============================================================================

shared_key_credential::shared_key_credential(std::string account_name,
                                             std::vector<uint8_t> key)
    : account_name_(std::move(account_name)), key_(std::move(key)) {}

auto shared_key_credential::create(std::string account_name,
                                   std::string_view base64_key)
    -> result<std::shared_ptr<shared_key_credential>> {
    if (account_name.empty()) {
        return unexpected{error{error_code::invalid_argument, "Account name is empty"}};
    }
    auto key = storage_utils::try_base64_decode(base64_key);
    if (!key || key->empty()) {
        BS_LOG_ERROR(log_category::auth,
                     "Rejected account key for " + account_name + ": not valid base64");
        return unexpected{error{error_code::invalid_key,
            "Account key is empty or not valid base64"}};
    }
    return std::make_shared<shared_key_credential>(std::move(account_name), std::move(*key));
}

auto shared_key_credential::sign(std::string_view string_to_sign) const
    -> result<std::string> {
    return shared_key_signer::compute_signature(key_, string_to_sign);
}

auto shared_key_credential::create_policy() const -> std::shared_ptr<const http_policy> {
    return std::make_shared<shared_key_policy>(account_name_, key_);
}

}  // namespace kcenon::blob_storage
