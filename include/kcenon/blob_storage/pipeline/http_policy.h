/**
 * @file http_policy.h
 * @brief Pipeline stage interface and index-based continuation
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_STORAGE_PIPELINE_HTTP_POLICY_H
#define KCENON_BLOB_STORAGE_PIPELINE_HTTP_POLICY_H

#include "kcenon/blob_storage/core/types.h"
#include "kcenon/blob_storage/http/http_message.h"
#include "kcenon/blob_storage/http/request_context.h"

#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace kcenon::blob_storage {

class http_policy;

using policy_list = std::vector<std::shared_ptr<const http_policy>>;

/**
 * @brief Continuation handed to a policy: "send through the rest of the chain"
 *
 * A next_policy is a cheap (list, index) pair created per call. Policies hold
 * no reference to their successor, so one policy instance can serve any
 * number of concurrent requests.
 */
class next_policy {
public:
    next_policy(const policy_list& policies, std::size_t index) noexcept
        : policies_(&policies), index_(index) {}

    /**
     * @brief Invoke the next stage of the chain
     */
    [[nodiscard]] auto send(http_request& request,
                            const request_context& context) const
        -> result<http_response>;

private:
    const policy_list* policies_;
    std::size_t index_;
};

/**
 * @brief One stage of the request pipeline
 *
 * Implementations must be stateless with respect to individual requests:
 * send() is const and may run concurrently on many threads. Per-request
 * state belongs in the request_context or in locals of send().
 */
class http_policy {
public:
    virtual ~http_policy() = default;

    /**
     * @brief Process a request and (usually) forward it via @p next
     * @param request Request owned by the caller of this stage; may be mutated
     * @param next Continuation to the following stage
     * @param context Per-invocation cancellation/deadline/try state
     */
    [[nodiscard]] virtual auto send(http_request& request,
                                    const next_policy& next,
                                    const request_context& context) const
        -> result<http_response> = 0;

    /**
     * @brief Stage name for diagnostics
     */
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

}  // namespace kcenon::blob_storage

#endif  // KCENON_BLOB_STORAGE_PIPELINE_HTTP_POLICY_H
