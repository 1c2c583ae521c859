/**
 * @file policies.h
 * @brief Built-in pipeline stages other than retry and credentials
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_STORAGE_PIPELINE_POLICIES_H
#define KCENON_BLOB_STORAGE_PIPELINE_POLICIES_H

#include "http_policy.h"
#include "kcenon/blob_storage/core/storage_constants.h"
#include "kcenon/blob_storage/transport/http_transport.h"

#include <chrono>
#include <memory>
#include <string>

namespace kcenon::blob_storage {

// ============================================================================
// Options
// ============================================================================

/**
 * @brief User-Agent configuration
 */
struct telemetry_options {
    /// Prepended to the library identifier, e.g. "MyApp/1.2"
    std::string user_agent_prefix;
};

/**
 * @brief Request logging configuration
 */
struct logging_options {
    /// Responses at or above this duration are logged as SLOW OPERATION
    std::chrono::milliseconds min_duration_to_log_slow_requests{3000};
};

// ============================================================================
// Stages
// ============================================================================

/**
 * @brief Sets the User-Agent header
 *
 * Value: "{prefix} Azure-Storage-Cpp/{version}({platform})", without the
 * prefix and separating space when no prefix is configured.
 */
class telemetry_policy : public http_policy {
public:
    explicit telemetry_policy(telemetry_options options = {});

    [[nodiscard]] auto send(http_request& request,
                            const next_policy& next,
                            const request_context& context) const
        -> result<http_response> override;

    [[nodiscard]] auto name() const -> std::string_view override { return "telemetry"; }

    [[nodiscard]] auto user_agent() const -> const std::string& { return user_agent_; }

private:
    std::string user_agent_;
};

/**
 * @brief Adds x-ms-client-request-id when the caller did not supply one
 */
class request_id_policy : public http_policy {
public:
    [[nodiscard]] auto send(http_request& request,
                            const next_policy& next,
                            const request_context& context) const
        -> result<http_response> override;

    [[nodiscard]] auto name() const -> std::string_view override { return "request_id"; }
};

/**
 * @brief Stamps x-ms-date on every try and x-ms-version when absent
 */
class date_policy : public http_policy {
public:
    explicit date_policy(std::string service_version =
                             std::string(storage_constants::target_storage_version));

    [[nodiscard]] auto send(http_request& request,
                            const next_policy& next,
                            const request_context& context) const
        -> result<http_response> override;

    [[nodiscard]] auto name() const -> std::string_view override { return "date"; }

private:
    std::string service_version_;
};

/**
 * @brief Decodes the service error code of non-2xx responses
 *
 * Uses the x-ms-error-code header, falling back to the <Code> element of an
 * XML error body.
 */
class response_decoding_policy : public http_policy {
public:
    [[nodiscard]] auto send(http_request& request,
                            const next_policy& next,
                            const request_context& context) const
        -> result<http_response> override;

    [[nodiscard]] auto name() const -> std::string_view override { return "response_decoding"; }
};

/**
 * @brief Logs every try with its outcome and timing
 */
class logging_policy : public http_policy {
public:
    explicit logging_policy(logging_options options = {});

    [[nodiscard]] auto send(http_request& request,
                            const next_policy& next,
                            const request_context& context) const
        -> result<http_response> override;

    [[nodiscard]] auto name() const -> std::string_view override { return "logging"; }

    /**
     * @brief Whether a status is logged as REQUEST ERROR
     *
     * True for 5xx and for 4xx other than 404, 409, 412 and 416, which are
     * expected outcomes of conditional and existence checks.
     */
    [[nodiscard]] static auto is_error_status(int status_code) -> bool;

private:
    logging_options options_;
};

/**
 * @brief Terminal stage: hands the request to the transport
 *
 * Waits on the transport future while watching the try context. Caller
 * cancellation yields operation_cancelled; an expired try deadline cancels
 * the try context and yields try_timeout.
 */
class transport_policy : public http_policy {
public:
    explicit transport_policy(std::shared_ptr<http_transport> transport);

    [[nodiscard]] auto send(http_request& request,
                            const next_policy& next,
                            const request_context& context) const
        -> result<http_response> override;

    [[nodiscard]] auto name() const -> std::string_view override { return "transport"; }

private:
    std::shared_ptr<http_transport> transport_;
};

}  // namespace kcenon::blob_storage

#endif  // KCENON_BLOB_STORAGE_PIPELINE_POLICIES_H
