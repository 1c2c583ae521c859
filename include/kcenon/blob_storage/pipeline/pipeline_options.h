/**
 * @file pipeline_options.h
 * @brief Pipeline configuration and builder
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_STORAGE_PIPELINE_PIPELINE_OPTIONS_H
#define KCENON_BLOB_STORAGE_PIPELINE_PIPELINE_OPTIONS_H

#include "policies.h"
#include "retry_policy.h"

#include <cstddef>
#include <memory>
#include <string>

namespace kcenon::blob_storage {

/**
 * @brief Configuration for a default pipeline
 */
struct pipeline_options {
    retry_options retry;
    telemetry_options telemetry;
    logging_options logging;

    /// Transport; nullptr selects the network_system transport
    std::shared_ptr<http_transport> transport;

    /// Workers for send_async (0 = hardware concurrency)
    std::size_t worker_count = 0;

    /// Service version stamped as x-ms-version
    std::string service_version = storage_constants::target_storage_version;

    [[nodiscard]] auto validate() const -> result<void> {
        return retry.validate();
    }
};

/**
 * @brief Fluent builder for pipeline_options
 *
 * @code
 * auto options = pipeline_options_builder()
 *     .with_max_tries(5)
 *     .with_secondary_host("myaccount-secondary.blob.core.windows.net")
 *     .with_user_agent_prefix("backup-agent/2.1")
 *     .build();
 * @endcode
 */
class pipeline_options_builder {
public:
    auto with_retry_options(retry_options retry) -> pipeline_options_builder& {
        options_.retry = std::move(retry);
        return *this;
    }

    auto with_retry_policy_type(retry_policy_type type) -> pipeline_options_builder& {
        options_.retry.policy_type = type;
        return *this;
    }

    auto with_max_tries(uint32_t max_tries) -> pipeline_options_builder& {
        options_.retry.max_tries = max_tries;
        return *this;
    }

    auto with_try_timeout(std::chrono::milliseconds timeout) -> pipeline_options_builder& {
        options_.retry.try_timeout = timeout;
        return *this;
    }

    auto with_retry_delay(std::chrono::milliseconds delay,
                          std::chrono::milliseconds max_delay) -> pipeline_options_builder& {
        options_.retry.retry_delay = delay;
        options_.retry.max_retry_delay = max_delay;
        return *this;
    }

    auto with_secondary_host(std::string host) -> pipeline_options_builder& {
        options_.retry.secondary_host = std::move(host);
        return *this;
    }

    auto with_user_agent_prefix(std::string prefix) -> pipeline_options_builder& {
        options_.telemetry.user_agent_prefix = std::move(prefix);
        return *this;
    }

    auto with_slow_request_threshold(std::chrono::milliseconds threshold)
        -> pipeline_options_builder& {
        options_.logging.min_duration_to_log_slow_requests = threshold;
        return *this;
    }

    auto with_transport(std::shared_ptr<http_transport> transport) -> pipeline_options_builder& {
        options_.transport = std::move(transport);
        return *this;
    }

    auto with_worker_count(std::size_t count) -> pipeline_options_builder& {
        options_.worker_count = count;
        return *this;
    }

    auto with_service_version(std::string version) -> pipeline_options_builder& {
        options_.service_version = std::move(version);
        return *this;
    }

    /**
     * @brief Validate and return the options
     */
    [[nodiscard]] auto build() const -> result<pipeline_options> {
        auto valid = options_.validate();
        if (!valid) {
            return unexpected{valid.error()};
        }
        return options_;
    }

private:
    pipeline_options options_;
};

}  // namespace kcenon::blob_storage

#endif  // KCENON_BLOB_STORAGE_PIPELINE_PIPELINE_OPTIONS_H
