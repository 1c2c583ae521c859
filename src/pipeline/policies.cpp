/**
 * @file policies.cpp
 * @brief Built-in pipeline stages
 * @version 0.1.0
 */

#include "kcenon/blob_storage/pipeline/policies.h"
#include "kcenon/blob_storage/core/logging.h"
#include "kcenon/blob_storage/core/storage_utils.h"

#include <exception>
#include <future>

namespace kcenon::blob_storage {

namespace {

constexpr auto transport_poll_interval = std::chrono::milliseconds(10);

constexpr auto platform_name() -> const char* {
#if defined(_WIN32)
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

auto elapsed_ms(std::chrono::steady_clock::time_point since) -> uint64_t {
    auto elapsed = std::chrono::steady_clock::now() - since;
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
}

}  // namespace

// ============================================================================
// next_policy
// ============================================================================

auto next_policy::send(http_request& request,
                       const request_context& context) const
    -> result<http_response> {
    if (index_ >= policies_->size()) {
        return unexpected{error{error_code::internal_error,
            "Pipeline ended without a transport stage"}};
    }
    const auto& policy = (*policies_)[index_];
    return policy->send(request, next_policy(*policies_, index_ + 1), context);
}

// ============================================================================
// telemetry_policy
// ============================================================================

telemetry_policy::telemetry_policy(telemetry_options options) {
    std::string identifier = std::string(storage_constants::user_agent_name) + "/" +
                             storage_constants::user_agent_version + "(" +
                             platform_name() + ")";
    if (options.user_agent_prefix.empty()) {
        user_agent_ = std::move(identifier);
    } else {
        user_agent_ = options.user_agent_prefix + " " + identifier;
    }
}

auto telemetry_policy::send(http_request& request,
                            const next_policy& next,
                            const request_context& context) const
    -> result<http_response> {
    request.headers.set(header_names::user_agent, user_agent_);
    return next.send(request, context);
}

// ============================================================================
// request_id_policy
// ============================================================================

auto request_id_policy::send(http_request& request,
                             const next_policy& next,
                             const request_context& context) const
    -> result<http_response> {
    if (!request.headers.contains(header_names::client_request_id)) {
        request.headers.set(header_names::client_request_id, storage_utils::generate_uuid());
    }
    return next.send(request, context);
}

// ============================================================================
// date_policy
// ============================================================================

date_policy::date_policy(std::string service_version)
    : service_version_(std::move(service_version)) {}

auto date_policy::send(http_request& request,
                       const next_policy& next,
                       const request_context& context) const
    -> result<http_response> {
    request.headers.set(header_names::date, storage_utils::get_rfc1123_time());
    if (!request.headers.contains(header_names::version)) {
        request.headers.set(header_names::version, service_version_);
    }
    return next.send(request, context);
}

// ============================================================================
// response_decoding_policy
// ============================================================================

auto response_decoding_policy::send(http_request& request,
                                    const next_policy& next,
                                    const request_context& context) const
    -> result<http_response> {
    auto outcome = next.send(request, context);
    if (!outcome) {
        return outcome;
    }

    auto& response = outcome.value();
    if (response.is_success() || response.service_error_code) {
        return outcome;
    }

    if (auto code = response.headers.get(header_names::error_code)) {
        response.service_error_code = std::move(*code);
    } else if (!response.body.empty()) {
        response.service_error_code =
            storage_utils::extract_xml_element(response.get_body_string(), "Code");
    }
    return outcome;
}

// ============================================================================
// logging_policy
// ============================================================================

logging_policy::logging_policy(logging_options options)
    : options_(options) {}

auto logging_policy::is_error_status(int status_code) -> bool {
    if (status_code >= 500) {
        return true;
    }
    if (status_code >= 400) {
        return status_code != 404 && status_code != 409 &&
               status_code != 412 && status_code != 416;
    }
    return false;
}

auto logging_policy::send(http_request& request,
                          const next_policy& next,
                          const request_context& context) const
    -> result<http_response> {
    const auto try_start = std::chrono::steady_clock::now();
    const uint32_t try_number = context.try_number() == 0 ? 1 : context.try_number();

    request_log_context log_ctx;
    log_ctx.request_id = request.headers.get_or_empty(header_names::client_request_id);
    log_ctx.method = request.method;
    log_ctx.url = sensitive_info_masker{}.mask(request.url.to_string());
    log_ctx.try_number = try_number;

    BS_LOG_INFO_CTX(log_category::pipeline,
                    "OUTGOING REQUEST (Try number=" + std::to_string(try_number) + ")",
                    log_ctx);

    auto outcome = next.send(request, context);

    log_ctx.try_duration_ms = elapsed_ms(try_start);
    log_ctx.operation_duration_ms = elapsed_ms(context.operation_start());

    if (!outcome) {
        log_ctx.error_message = outcome.error().message;
        BS_LOG_ERROR_CTX(log_category::pipeline,
                         "Unexpected failure attempting to make request", log_ctx);
        return outcome;
    }

    const int status = outcome.value().status_code;
    log_ctx.status_code = status;

    const auto slow_threshold =
        static_cast<uint64_t>(options_.min_duration_to_log_slow_requests.count());
    const bool slow = *log_ctx.try_duration_ms >= slow_threshold;
    const bool failed = is_error_status(status);

    // An error status outranks slowness; both messages are kept
    if (slow && failed) {
        BS_LOG_ERROR_CTX(log_category::pipeline, "SLOW OPERATION. REQUEST ERROR", log_ctx);
    } else if (failed) {
        BS_LOG_ERROR_CTX(log_category::pipeline, "REQUEST ERROR", log_ctx);
    } else if (slow) {
        BS_LOG_WARN_CTX(log_category::pipeline, "SLOW OPERATION", log_ctx);
    } else {
        BS_LOG_INFO_CTX(log_category::pipeline, "Successfully Received Response", log_ctx);
    }

    return outcome;
}

// ============================================================================
// transport_policy
// ============================================================================

transport_policy::transport_policy(std::shared_ptr<http_transport> transport)
    : transport_(std::move(transport)) {}

auto transport_policy::send(http_request& request,
                            [[maybe_unused]] const next_policy& next,
                            const request_context& context) const
    -> result<http_response> {
    if (!transport_) {
        return unexpected{error{error_code::transport_unavailable,
            "No HTTP transport configured"}};
    }
    if (context.is_cancelled()) {
        return unexpected{error{error_code::operation_cancelled,
            "Operation cancelled before the request was sent"}};
    }

    std::future<result<http_response>> pending;
    try {
        pending = transport_->send(request, context);
    } catch (const std::exception& e) {
        BS_LOG_ERROR(log_category::transport,
                     std::string("Transport threw while sending: ") + e.what());
        return unexpected{error{error_code::transport_error, e.what()}};
    }

    if (!pending.valid()) {
        return unexpected{error{error_code::internal_error,
            "Transport returned an invalid future"}};
    }

    while (pending.wait_for(transport_poll_interval) != std::future_status::ready) {
        if (context.is_cancelled()) {
            return unexpected{error{error_code::operation_cancelled,
                "Operation cancelled while waiting for the response"}};
        }
        if (context.deadline_exceeded()) {
            // Abandon the in-flight exchange; the transport sees the cancelled try
            context.cancel();
            BS_LOG_WARN(log_category::transport, "Try timed out waiting for the response");
            return unexpected{error{error_code::try_timeout,
                "Try timed out waiting for the response"}};
        }
    }

    try {
        return pending.get();
    } catch (const std::exception& e) {
        BS_LOG_ERROR(log_category::transport,
                     std::string("Transport failed: ") + e.what());
        return unexpected{error{error_code::transport_error, e.what()}};
    }
}

}  // namespace kcenon::blob_storage
