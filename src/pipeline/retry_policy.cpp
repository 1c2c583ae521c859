/**
 * @file retry_policy.cpp
 * @brief Retry stage implementation
 * @version 0.1.0
 */

#include "kcenon/blob_storage/pipeline/retry_policy.h"
#include "kcenon/blob_storage/core/logging.h"

#include <algorithm>
#include <cstdint>
#include <random>

namespace kcenon::blob_storage {

namespace {

/**
 * @brief Decision taken after one try
 */
enum class try_disposition {
    done,       ///< Return the outcome to the caller
    retry       ///< Try again if tries remain
};

auto is_read_method(const std::string& method) -> bool {
    return method == http_method::get || method == http_method::head;
}

auto cancelled_error() -> error {
    return error{error_code::operation_cancelled, "Operation was cancelled"};
}

auto timed_out_error() -> error {
    return error{error_code::operation_timeout, "Operation deadline exceeded"};
}

}  // namespace

// ============================================================================
// retry_options
// ============================================================================

auto retry_options::validate() const -> result<void> {
    if (max_tries < 1) {
        return unexpected{error{error_code::invalid_argument,
            "max_tries must be at least 1"}};
    }
    if (try_timeout.count() <= 0) {
        return unexpected{error{error_code::invalid_argument,
            "try_timeout must be positive"}};
    }
    if (retry_delay.count() < 0 || max_retry_delay.count() < 0) {
        return unexpected{error{error_code::invalid_argument,
            "retry delays must not be negative"}};
    }
    if (retry_delay > max_retry_delay) {
        return unexpected{error{error_code::invalid_argument,
            "retry_delay must not exceed max_retry_delay"}};
    }
    if (secondary_host && secondary_host->empty()) {
        return unexpected{error{error_code::invalid_argument,
            "secondary_host must not be empty when set"}};
    }
    if (secondary_delay_min.count() < 0 || secondary_delay_min > secondary_delay_max) {
        return unexpected{error{error_code::invalid_argument,
            "secondary delay window is invalid"}};
    }
    return {};
}

auto retry_options::primary_delay(uint32_t primary_try) const -> std::chrono::milliseconds {
    if (primary_try <= 1) {
        return std::chrono::milliseconds::zero();
    }

    if (policy_type == retry_policy_type::fixed) {
        return std::min(retry_delay, max_retry_delay);
    }

    // (2^(n-1) - 1) * delay, capped; the cap is checked before multiplying
    const auto base = static_cast<int64_t>(retry_delay.count());
    const auto cap = static_cast<int64_t>(max_retry_delay.count());
    if (base <= 0 || cap <= 0) {
        return std::chrono::milliseconds::zero();
    }
    const uint32_t exponent = primary_try - 1;
    if (exponent >= 62) {
        return max_retry_delay;
    }
    const int64_t factor = (int64_t{1} << exponent) - 1;
    if (factor > cap / base) {
        return max_retry_delay;
    }
    return std::chrono::milliseconds(factor * base);
}

// ============================================================================
// retry_policy
// ============================================================================

retry_policy::retry_policy(retry_options options)
    : options_(std::move(options)) {}

auto retry_policy::create(retry_options options)
    -> result<std::shared_ptr<retry_policy>> {
    auto valid = options.validate();
    if (!valid) {
        return unexpected{valid.error()};
    }
    return std::make_shared<retry_policy>(std::move(options));
}

auto retry_policy::secondary_delay() const -> std::chrono::milliseconds {
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<int64_t> dis(options_.secondary_delay_min.count(),
                                               options_.secondary_delay_max.count());
    return std::chrono::milliseconds(dis(gen));
}

auto retry_policy::send(http_request& request,
                        const next_policy& next,
                        const request_context& context) const
    -> result<http_response> {
    bool consider_secondary = options_.secondary_host.has_value() &&
                              is_read_method(request.method);
    uint32_t primary_try = 0;
    result<http_response> last_outcome = unexpected{error{error_code::internal_error,
        "Retry policy made no attempt"}};

    for (uint32_t attempt = 1; attempt <= options_.max_tries; ++attempt) {
        const bool to_primary = !consider_secondary || (attempt % 2 == 1);
        if (to_primary) {
            ++primary_try;
        }

        const auto delay = to_primary ? options_.primary_delay(primary_try)
                                      : secondary_delay();
        if (delay.count() > 0) {
            BS_LOG_DEBUG(log_category::retry,
                         "Waiting " + std::to_string(delay.count()) +
                         "ms before try " + std::to_string(attempt));
            switch (context.wait_for(delay)) {
                case request_context::wait_status::cancelled:
                    return unexpected{cancelled_error()};
                case request_context::wait_status::deadline_exceeded:
                    return unexpected{timed_out_error()};
                case request_context::wait_status::elapsed:
                    break;
            }
        }
        if (context.is_cancelled()) {
            return unexpected{cancelled_error()};
        }
        if (context.deadline_exceeded()) {
            return unexpected{timed_out_error()};
        }

        http_request try_request = request;
        if (!to_primary) {
            try_request.url = request.url.with_host(*options_.secondary_host);
        }

        auto try_context = context.begin_try(
            attempt, request_context::clock::now() + options_.try_timeout);
        auto outcome = next.send(try_request, try_context);

        auto disposition = try_disposition::done;
        if (!outcome) {
            const auto code = outcome.error().code;
            if (code == error_code::operation_cancelled || context.is_cancelled()) {
                return unexpected{cancelled_error()};
            }
            if (code == error_code::try_timeout && context.deadline_exceeded()) {
                return unexpected{timed_out_error()};
            }
            disposition = is_transient(code) ? try_disposition::retry
                                             : try_disposition::done;
            if (disposition == try_disposition::retry) {
                BS_LOG_WARN(log_category::retry,
                            "Try " + std::to_string(attempt) + " failed: " +
                            outcome.error().message);
            }
        } else {
            const int status = outcome.value().status_code;
            if (!to_primary && status == 404) {
                // The replica has not caught up; stop reading from it
                consider_secondary = false;
                disposition = try_disposition::retry;
                BS_LOG_INFO(log_category::retry,
                            "Secondary returned 404, retrying against primary only");
            } else if (status == 500 || status == 503) {
                disposition = try_disposition::retry;
                BS_LOG_WARN(log_category::retry,
                            "Try " + std::to_string(attempt) + " returned HTTP " +
                            std::to_string(status));
            }
        }

        if (disposition == try_disposition::done) {
            return outcome;
        }
        last_outcome = std::move(outcome);
    }

    BS_LOG_ERROR(log_category::retry,
                 "Giving up after " + std::to_string(options_.max_tries) + " tries");
    return last_outcome;
}

}  // namespace kcenon::blob_storage
