/**
 * @file network_http_transport.cpp
 * @brief network_system-backed transport implementation
 * @version 0.1.0
 */

#include "kcenon/blob_storage/transport/http_transport.h"
#include "kcenon/blob_storage/core/logging.h"

#include "kcenon/blob_storage/config/feature_flags.h"

#include <exception>

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::blob_storage {

// ============================================================================
// Implementation
// ============================================================================

struct network_http_transport::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    std::shared_ptr<adapters::pipeline_thread_pool_interface> pool;
    bool available = false;

    impl(std::shared_ptr<adapters::pipeline_thread_pool_interface> p,
         std::chrono::milliseconds timeout)
        : pool(std::move(p)) {
        if (!pool) {
            pool = adapters::pipeline_pool_factory::create(0, "blob_storage_transport");
        }
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
        available = false;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response {
        http_response result;
        result.status_code = resp.status_code;
        result.headers = http_headers::from_map(resp.headers);
        result.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return result;
    }

    auto execute(const http_request& request) -> result<http_response> {
        if (!client) {
            return unexpected{error{error_code::internal_error,
                "HTTP client not initialized"}};
        }

        auto url = request.url.to_string();
        auto headers = request.headers.to_map();
        std::string body;
        if (request.body) {
            body.assign(request.body->begin(), request.body->end());
        }

        const auto& method = request.method;
        if (method == http_method::get) {
            auto response = client->get(url, {}, headers);
            if (response.is_err()) {
                return unexpected{error{error_code::transport_error, "HTTP GET request failed"}};
            }
            return convert_response(response.value());
        }
        if (method == http_method::head) {
            auto response = client->head(url, headers);
            if (response.is_err()) {
                return unexpected{error{error_code::transport_error, "HTTP HEAD request failed"}};
            }
            return convert_response(response.value());
        }
        if (method == http_method::put) {
            auto response = client->put(url, body, headers);
            if (response.is_err()) {
                return unexpected{error{error_code::transport_error, "HTTP PUT request failed"}};
            }
            return convert_response(response.value());
        }
        if (method == http_method::post) {
            auto response = client->post(url, body, headers);
            if (response.is_err()) {
                return unexpected{error{error_code::transport_error, "HTTP POST request failed"}};
            }
            return convert_response(response.value());
        }
        if (method == http_method::del) {
            auto response = client->del(url, headers);
            if (response.is_err()) {
                return unexpected{error{error_code::transport_error, "HTTP DELETE request failed"}};
            }
            return convert_response(response.value());
        }

        return unexpected{error{error_code::invalid_argument,
            "Unsupported HTTP method: " + method}};
    }
#endif
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

network_http_transport::network_http_transport(
    std::shared_ptr<adapters::pipeline_thread_pool_interface> pool,
    std::chrono::milliseconds timeout)
    : impl_(std::make_shared<impl>(std::move(pool), timeout)) {}

network_http_transport::~network_http_transport() = default;

// ============================================================================
// Send
// ============================================================================

auto network_http_transport::send(const http_request& request,
                                  const request_context& context)
    -> std::future<result<http_response>> {
    auto promise = std::make_shared<std::promise<result<http_response>>>();
    auto future = promise->get_future();

#if KCENON_WITH_NETWORK_SYSTEM
    // impl is captured by shared_ptr: an abandoned try may finish after the
    // transport object is gone
    auto state = impl_;
    state->pool->submit([state, request, context, promise]() {
        if (context.is_cancelled()) {
            promise->set_value(unexpected{error{error_code::operation_cancelled,
                "Request cancelled before it was sent"}});
            return;
        }
        try {
            promise->set_value(state->execute(request));
        } catch (const std::exception& e) {
            promise->set_value(unexpected{error{error_code::transport_error, e.what()}});
        }
    });
#else
    (void)request;
    (void)context;
    BS_LOG_ERROR(log_category::transport,
                 "HTTP transport not available (KCENON_WITH_NETWORK_SYSTEM not defined)");
    promise->set_value(unexpected{error{error_code::transport_unavailable,
        "HTTP transport not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}});
#endif

    return future;
}

auto network_http_transport::is_available() const noexcept -> bool {
    return impl_->available;
}

// ============================================================================
// Factory Function
// ============================================================================

auto make_network_http_transport(
    std::shared_ptr<adapters::pipeline_thread_pool_interface> pool,
    std::chrono::milliseconds timeout) -> std::shared_ptr<http_transport> {
    return std::make_shared<network_http_transport>(std::move(pool), timeout);
}

}  // namespace kcenon::blob_storage
