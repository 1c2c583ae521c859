/**
 * @file request_context.h
 * @brief Per-invocation cancellation, deadline and try state
 * @version 0.1.0
 */

#ifndef KCENON_BLOB_STORAGE_HTTP_REQUEST_CONTEXT_H
#define KCENON_BLOB_STORAGE_HTTP_REQUEST_CONTEXT_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace kcenon::blob_storage {

/**
 * @brief Per-invocation state that travels down the pipeline
 *
 * Contexts form a tree. Cancelling a context cancels every descendant,
 * including ones created after the cancellation. A child's deadline is never
 * later than its parent's. Copies share state, so a copy kept by the caller
 * can cancel an operation running on another thread.
 *
 * @code
 * auto ctx = request_context::with_timeout(std::chrono::seconds(60));
 * auto future = pipeline->send_async(std::move(request), ctx);
 * // ...
 * ctx.cancel();  // aborts the in-flight try and prevents further retries
 * @endcode
 */
class request_context {
public:
    using clock = std::chrono::steady_clock;
    using time_point = clock::time_point;

    /**
     * @brief Outcome of wait_for()
     */
    enum class wait_status {
        elapsed,            ///< The full delay passed
        cancelled,          ///< The context was cancelled during the wait
        deadline_exceeded   ///< The context deadline arrived before the delay ended
    };

    /**
     * @brief Create a root context without deadline
     */
    request_context();

    /**
     * @brief Create a root context that expires after @p timeout
     */
    [[nodiscard]] static auto with_timeout(std::chrono::milliseconds timeout) -> request_context;

    /**
     * @brief Child context with an additional deadline
     */
    [[nodiscard]] auto with_deadline(time_point deadline) const -> request_context;

    /**
     * @brief Child context marking the start of one logical operation
     */
    [[nodiscard]] auto begin_operation() const -> request_context;

    /**
     * @brief Child context for a single try
     * @param try_number 1-based try number
     * @param deadline Per-try deadline (clamped to this context's deadline)
     */
    [[nodiscard]] auto begin_try(uint32_t try_number,
                                 std::optional<time_point> deadline) const -> request_context;

    /**
     * @brief Cancel this context and all of its descendants
     */
    void cancel() const;

    [[nodiscard]] auto is_cancelled() const -> bool;

    /**
     * @brief Effective deadline (earliest along the chain)
     */
    [[nodiscard]] auto deadline() const -> std::optional<time_point>;

    [[nodiscard]] auto deadline_exceeded() const -> bool;

    /**
     * @brief Wait for @p delay, returning early on cancellation or deadline
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds delay) const -> wait_status;

    /**
     * @brief Try number set by the retry policy (0 outside a retry)
     */
    [[nodiscard]] auto try_number() const -> uint32_t;

    /**
     * @brief Time the current logical operation started
     */
    [[nodiscard]] auto operation_start() const -> time_point;

private:
    struct state;

    explicit request_context(std::shared_ptr<state> s);

    static void cancel_tree(const std::shared_ptr<state>& s);

    [[nodiscard]] auto make_child(std::optional<time_point> deadline,
                                  std::optional<uint32_t> try_number,
                                  std::optional<time_point> operation_start) const
        -> request_context;

    std::shared_ptr<state> state_;
};

}  // namespace kcenon::blob_storage

#endif  // KCENON_BLOB_STORAGE_HTTP_REQUEST_CONTEXT_H
