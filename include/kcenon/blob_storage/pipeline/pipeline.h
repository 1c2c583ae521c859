/**
 * @file pipeline.h
 * @brief Ordered chain of policies ending at a transport
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_STORAGE_PIPELINE_PIPELINE_H
#define KCENON_BLOB_STORAGE_PIPELINE_PIPELINE_H

#include "http_policy.h"
#include "pipeline_options.h"
#include "kcenon/blob_storage/adapters/thread_pool_adapter.h"
#include "kcenon/blob_storage/auth/credential.h"

#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kcenon::blob_storage {

/**
 * @brief Immutable request pipeline
 *
 * The default pipeline runs, in order: telemetry, request id, retry, date,
 * credential, response decoding, logging and transport. Stages before retry
 * run once per operation; stages after it run once per try.
 *
 * A pipeline is shared by any number of concurrent requests.
 *
 * @code
 * auto cred = shared_key_credential::create("myaccount", key);
 * auto p = pipeline::create(cred.value(), pipeline_options_builder()
 *                                              .with_max_tries(3)
 *                                              .build()
 *                                              .value());
 * http_request req(http_method::get,
 *                  http_url::parse("https://myaccount.blob.core.windows.net/c/b").value());
 * auto response = p.value()->send(req);
 * @endcode
 */
class pipeline {
public:
    /**
     * @brief Build the default pipeline
     * @param cred Credential contributing the authorization stage
     * @param options Retry/telemetry/logging/transport configuration
     * @return Pipeline, or invalid_argument for bad options or a null credential
     */
    [[nodiscard]] static auto create(const std::shared_ptr<const credential>& cred,
                                     pipeline_options options = {})
        -> result<std::shared_ptr<pipeline>>;

    /**
     * @brief Build a pipeline from a custom policy list
     *
     * A transport stage for @p transport is appended after @p policies.
     */
    [[nodiscard]] static auto create(policy_list policies,
                                     std::shared_ptr<http_transport> transport,
                                     std::size_t worker_count = 0)
        -> std::shared_ptr<pipeline>;

    ~pipeline();

    pipeline(const pipeline&) = delete;
    auto operator=(const pipeline&) -> pipeline& = delete;

    /**
     * @brief Send a request through the chain, blocking until it completes
     * @param request Request; copied per try by the retry stage
     * @param context Caller context; cancel it to abort the operation
     */
    [[nodiscard]] auto send(http_request request,
                            const request_context& context = request_context{}) const
        -> result<http_response>;

    /**
     * @brief Send a request on the pipeline thread pool
     */
    [[nodiscard]] auto send_async(http_request request,
                                  request_context context = request_context{}) const
        -> std::future<result<http_response>>;

    /**
     * @brief Stage names in execution order (transport last)
     */
    [[nodiscard]] auto policy_names() const -> std::vector<std::string>;

private:
    pipeline(policy_list policies, std::size_t worker_count);

    // Shared with in-flight async sends; the pool is never owned by a task
    std::shared_ptr<const policy_list> policies_;
    std::size_t worker_count_;
    mutable std::once_flag pool_once_;
    mutable std::shared_ptr<adapters::pipeline_thread_pool_interface> pool_;
};

}  // namespace kcenon::blob_storage

#endif  // KCENON_BLOB_STORAGE_PIPELINE_PIPELINE_H
