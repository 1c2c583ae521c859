/**
 * @file http_transport.h
 * @brief Transport abstraction at the end of the request pipeline
 * @version 0.1.0
 *
 * The pipeline never talks to the network directly; it hands each try to an
 * http_transport. The default implementation wraps the network_system HTTP
 * client. Tests and embedders inject their own.
 */

#ifndef KCENON_BLOB_STORAGE_TRANSPORT_HTTP_TRANSPORT_H
#define KCENON_BLOB_STORAGE_TRANSPORT_HTTP_TRANSPORT_H

#include "kcenon/blob_storage/adapters/thread_pool_adapter.h"
#include "kcenon/blob_storage/core/types.h"
#include "kcenon/blob_storage/http/http_message.h"
#include "kcenon/blob_storage/http/request_context.h"

#include <chrono>
#include <future>
#include <memory>

// Forward declaration for network_system HTTP client
namespace kcenon::network::core {
class http_client;
}

namespace kcenon::blob_storage {

/**
 * @brief Asynchronous, cancellable HTTP transport
 *
 * send() must not block the caller for the duration of the exchange. The
 * context is cancelled when the caller gives up on the try; implementations
 * that can abort I/O should observe it.
 */
class http_transport {
public:
    virtual ~http_transport() = default;

    /**
     * @brief Send one request
     * @return Future resolving to the response, or to a transport_error
     */
    virtual auto send(const http_request& request,
                      const request_context& context)
        -> std::future<result<http_response>> = 0;
};

/**
 * @brief Transport backed by network_system's HTTP client
 *
 * Requests run on a pipeline thread pool. Without network_system every send
 * resolves to error_code::transport_unavailable.
 *
 * @note This transport is thread-safe for concurrent operations.
 */
class network_http_transport : public http_transport {
public:
    /**
     * @brief Construct transport
     * @param pool Pool that runs the blocking client calls (nullptr = default pool)
     * @param timeout Socket-level timeout handed to the HTTP client
     */
    explicit network_http_transport(
        std::shared_ptr<adapters::pipeline_thread_pool_interface> pool = nullptr,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~network_http_transport() override;

    network_http_transport(const network_http_transport&) = delete;
    auto operator=(const network_http_transport&) -> network_http_transport& = delete;

    auto send(const http_request& request,
              const request_context& context)
        -> std::future<result<http_response>> override;

    /**
     * @brief Check if a real HTTP client is compiled in
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::shared_ptr<impl> impl_;
};

/**
 * @brief Create the default transport
 */
[[nodiscard]] auto make_network_http_transport(
    std::shared_ptr<adapters::pipeline_thread_pool_interface> pool = nullptr,
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<http_transport>;

}  // namespace kcenon::blob_storage

#endif  // KCENON_BLOB_STORAGE_TRANSPORT_HTTP_TRANSPORT_H
