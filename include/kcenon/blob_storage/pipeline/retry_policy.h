/**
 * @file retry_policy.h
 * @brief Retry stage with exponential/fixed backoff and secondary failover
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_STORAGE_PIPELINE_RETRY_POLICY_H
#define KCENON_BLOB_STORAGE_PIPELINE_RETRY_POLICY_H

#include "http_policy.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::blob_storage {

/**
 * @brief Backoff schedule for primary tries
 */
enum class retry_policy_type {
    exponential,  ///< (2^(try-1) - 1) * retry_delay, capped at max_retry_delay
    fixed         ///< retry_delay between tries
};

/**
 * @brief Retry configuration
 *
 * @code
 * retry_options opts;
 * opts.max_tries = 5;
 * opts.secondary_host = "myaccount-secondary.blob.core.windows.net";
 * @endcode
 */
struct retry_options {
    retry_policy_type policy_type = retry_policy_type::exponential;

    /// Total number of tries, including the first (>= 1)
    uint32_t max_tries = 4;

    /// Upper bound for a single try; expiry cancels that try only
    std::chrono::milliseconds try_timeout{30000};

    /// Base delay between primary tries
    std::chrono::milliseconds retry_delay{4000};

    /// Cap on the computed primary delay
    std::chrono::milliseconds max_retry_delay{120000};

    /// Read-only replica host used for GET/HEAD retries
    std::optional<std::string> secondary_host;

    /// Jitter window before a secondary try
    std::chrono::milliseconds secondary_delay_min{800};
    std::chrono::milliseconds secondary_delay_max{1300};

    /**
     * @brief Check every field is in range
     * @return invalid_argument describing the first bad field
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Delay before a primary try
     * @param primary_try 1-based count of primary tries including this one
     */
    [[nodiscard]] auto primary_delay(uint32_t primary_try) const -> std::chrono::milliseconds;
};

/**
 * @brief Retry stage
 *
 * Each try runs the rest of the pipeline on a fresh copy of the request
 * under its own child context bounded by try_timeout. Tries alternate
 * between primary and secondary hosts for GET/HEAD when a secondary host is
 * configured; a 404 from the secondary stops further secondary tries.
 *
 * Retried: transport errors, per-try timeouts, HTTP 500 and 503, secondary
 * 404. Everything else, including exhaustion, surfaces unchanged.
 * Cancellation or the operation deadline ends the operation immediately.
 */
class retry_policy : public http_policy {
public:
    /**
     * @brief Create a retry stage
     * @return The stage, or invalid_argument for out-of-range options
     */
    [[nodiscard]] static auto create(retry_options options)
        -> result<std::shared_ptr<retry_policy>>;

    [[nodiscard]] auto send(http_request& request,
                            const next_policy& next,
                            const request_context& context) const
        -> result<http_response> override;

    [[nodiscard]] auto name() const -> std::string_view override { return "retry"; }

    [[nodiscard]] auto options() const -> const retry_options& { return options_; }

    explicit retry_policy(retry_options options);

private:
    [[nodiscard]] auto secondary_delay() const -> std::chrono::milliseconds;

    retry_options options_;
};

}  // namespace kcenon::blob_storage

#endif  // KCENON_BLOB_STORAGE_PIPELINE_RETRY_POLICY_H
