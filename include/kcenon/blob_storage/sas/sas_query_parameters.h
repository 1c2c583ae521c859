/**
 * @file sas_query_parameters.h
 * @brief Signed, immutable SAS query parameter set
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_STORAGE_SAS_SAS_QUERY_PARAMETERS_H
#define KCENON_BLOB_STORAGE_SAS_SAS_QUERY_PARAMETERS_H

#include "kcenon/blob_storage/http/http_url.h"

#include <string>
#include <vector>

namespace kcenon::blob_storage {

/**
 * @brief Protocols a SAS may be used over
 */
enum class sas_protocol {
    https_only,  ///< "https"
    https_http   ///< "https,http"
};

[[nodiscard]] constexpr auto to_string(sas_protocol protocol) -> const char* {
    switch (protocol) {
        case sas_protocol::https_only:
            return "https";
        case sas_protocol::https_http:
            return "https,http";
    }
    return "https";
}

/**
 * @brief Client IP address range a SAS is valid from
 */
struct sas_ip_range {
    std::string start;
    std::string end;

    /**
     * @brief "" when start is empty, "start" for a single address, else "start-end"
     */
    [[nodiscard]] auto to_string() const -> std::string {
        if (start.empty()) {
            return {};
        }
        if (end.empty() || end == start) {
            return start;
        }
        return start + "-" + end;
    }
};

class account_sas_values;
class service_sas_values;

/**
 * @brief The signed result of a SAS builder
 *
 * Instances come only from account_sas_values::sign(),
 * service_sas_values::sign() or parse(); none of the fields can change
 * afterwards. Absent fields are empty strings.
 */
class sas_query_parameters {
public:
    [[nodiscard]] auto version() const -> const std::string& { return version_; }
    [[nodiscard]] auto services() const -> const std::string& { return services_; }
    [[nodiscard]] auto resource_types() const -> const std::string& { return resource_types_; }
    [[nodiscard]] auto protocol() const -> const std::string& { return protocol_; }
    [[nodiscard]] auto start_time() const -> const std::string& { return start_time_; }
    [[nodiscard]] auto expiry_time() const -> const std::string& { return expiry_time_; }
    [[nodiscard]] auto ip_range() const -> const std::string& { return ip_range_; }
    [[nodiscard]] auto identifier() const -> const std::string& { return identifier_; }
    [[nodiscard]] auto resource() const -> const std::string& { return resource_; }
    [[nodiscard]] auto permissions() const -> const std::string& { return permissions_; }
    [[nodiscard]] auto signature() const -> const std::string& { return signature_; }
    [[nodiscard]] auto cache_control() const -> const std::string& { return cache_control_; }
    [[nodiscard]] auto content_disposition() const -> const std::string& { return content_disposition_; }
    [[nodiscard]] auto content_encoding() const -> const std::string& { return content_encoding_; }
    [[nodiscard]] auto content_language() const -> const std::string& { return content_language_; }
    [[nodiscard]] auto content_type() const -> const std::string& { return content_type_; }

    /**
     * @brief True when no SAS field is set
     */
    [[nodiscard]] auto empty() const -> bool;

    /**
     * @brief Render as a query string (no leading '?')
     *
     * Order: sv, ss, srt, spr, st, se, sip, si, sr, sp, rscc, rscd, rsce,
     * rscl, rsct, sig. Empty fields are omitted; values are percent-encoded.
     */
    [[nodiscard]] auto encode() const -> std::string;

    /**
     * @brief Non-empty fields as decoded (key, value) pairs in encode() order
     */
    [[nodiscard]] auto to_query_parameters() const -> std::vector<http_url::query_parameter>;

    /**
     * @brief Lift SAS fields out of a decoded query parameter list
     * @param query Parameters; SAS keys are matched case-insensitively
     * @param remove Erase the SAS keys from @p query
     */
    [[nodiscard]] static auto parse(std::vector<http_url::query_parameter>& query,
                                    bool remove) -> sas_query_parameters;

private:
    friend class account_sas_values;
    friend class service_sas_values;

    sas_query_parameters() = default;

    std::string version_;
    std::string services_;
    std::string resource_types_;
    std::string protocol_;
    std::string start_time_;
    std::string expiry_time_;
    std::string ip_range_;
    std::string identifier_;
    std::string resource_;
    std::string permissions_;
    std::string signature_;
    std::string cache_control_;
    std::string content_disposition_;
    std::string content_encoding_;
    std::string content_language_;
    std::string content_type_;
};

}  // namespace kcenon::blob_storage

#endif  // KCENON_BLOB_STORAGE_SAS_SAS_QUERY_PARAMETERS_H
