/**
 * @file sas_query_parameters.cpp
 * @brief SAS query string encoding and parsing
 * @version 0.1.0
 */

#include "kcenon/blob_storage/sas/sas_query_parameters.h"
#include "kcenon/blob_storage/core/storage_utils.h"

#include <algorithm>
#include <utility>

namespace kcenon::blob_storage {

namespace {

struct sas_field {
    const char* key;
    std::string sas_query_parameters::*member;
};

}  // namespace

auto sas_query_parameters::empty() const -> bool {
    return version_.empty() && services_.empty() && resource_types_.empty() &&
           protocol_.empty() && start_time_.empty() && expiry_time_.empty() &&
           ip_range_.empty() && identifier_.empty() && resource_.empty() &&
           permissions_.empty() && signature_.empty() && cache_control_.empty() &&
           content_disposition_.empty() && content_encoding_.empty() &&
           content_language_.empty() && content_type_.empty();
}

auto sas_query_parameters::to_query_parameters() const
    -> std::vector<http_url::query_parameter> {
    const std::pair<const char*, const std::string*> fields[] = {
        {"sv", &version_},
        {"ss", &services_},
        {"srt", &resource_types_},
        {"spr", &protocol_},
        {"st", &start_time_},
        {"se", &expiry_time_},
        {"sip", &ip_range_},
        {"si", &identifier_},
        {"sr", &resource_},
        {"sp", &permissions_},
        {"rscc", &cache_control_},
        {"rscd", &content_disposition_},
        {"rsce", &content_encoding_},
        {"rscl", &content_language_},
        {"rsct", &content_type_},
        {"sig", &signature_},
    };

    std::vector<http_url::query_parameter> parameters;
    for (const auto& [key, value] : fields) {
        if (!value->empty()) {
            parameters.emplace_back(key, *value);
        }
    }
    return parameters;
}

auto sas_query_parameters::encode() const -> std::string {
    std::string encoded;
    for (const auto& [key, value] : to_query_parameters()) {
        if (!encoded.empty()) {
            encoded += '&';
        }
        encoded += key;
        encoded += '=';
        encoded += storage_utils::url_encode(value);
    }
    return encoded;
}

auto sas_query_parameters::parse(std::vector<http_url::query_parameter>& query,
                                 bool remove) -> sas_query_parameters {
    static const sas_field fields[] = {
        {"sv", &sas_query_parameters::version_},
        {"ss", &sas_query_parameters::services_},
        {"srt", &sas_query_parameters::resource_types_},
        {"spr", &sas_query_parameters::protocol_},
        {"st", &sas_query_parameters::start_time_},
        {"se", &sas_query_parameters::expiry_time_},
        {"sip", &sas_query_parameters::ip_range_},
        {"si", &sas_query_parameters::identifier_},
        {"sr", &sas_query_parameters::resource_},
        {"sp", &sas_query_parameters::permissions_},
        {"sig", &sas_query_parameters::signature_},
        {"rscc", &sas_query_parameters::cache_control_},
        {"rscd", &sas_query_parameters::content_disposition_},
        {"rsce", &sas_query_parameters::content_encoding_},
        {"rscl", &sas_query_parameters::content_language_},
        {"rsct", &sas_query_parameters::content_type_},
    };

    auto match = [](const std::string& key) -> const sas_field* {
        for (const auto& field : fields) {
            if (storage_utils::iequals(key, field.key)) {
                return &field;
            }
        }
        return nullptr;
    };

    sas_query_parameters parsed;
    for (const auto& [key, value] : query) {
        if (const auto* field = match(key)) {
            // The first occurrence wins
            auto& target = parsed.*(field->member);
            if (target.empty()) {
                target = value;
            }
        }
    }

    if (remove) {
        query.erase(std::remove_if(query.begin(), query.end(),
                                   [&](const http_url::query_parameter& p) {
                                       return match(p.first) != nullptr;
                                   }),
                    query.end());
    }
    return parsed;
}

}  // namespace kcenon::blob_storage
