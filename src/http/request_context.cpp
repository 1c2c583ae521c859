/**
 * @file request_context.cpp
 * @brief Per-invocation cancellation, deadline and try state
 * @version 0.1.0
 */

#include "kcenon/blob_storage/http/request_context.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace kcenon::blob_storage {

struct request_context::state {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::weak_ptr<state>> children;

    std::optional<time_point> deadline;
    uint32_t try_number = 0;
    time_point operation_start = clock::now();
};

void request_context::cancel_tree(const std::shared_ptr<state>& s) {
    std::vector<std::shared_ptr<state>> children;
    {
        std::lock_guard<std::mutex> lock(s->mutex);
        if (s->cancelled.load()) {
            return;
        }
        s->cancelled.store(true);
        for (auto& weak : s->children) {
            if (auto child = weak.lock()) {
                children.push_back(std::move(child));
            }
        }
        s->children.clear();
    }
    s->cv.notify_all();

    for (const auto& child : children) {
        cancel_tree(child);
    }
}

request_context::request_context()
    : state_(std::make_shared<state>()) {}

request_context::request_context(std::shared_ptr<state> s)
    : state_(std::move(s)) {}

auto request_context::with_timeout(std::chrono::milliseconds timeout) -> request_context {
    request_context ctx;
    ctx.state_->deadline = clock::now() + timeout;
    return ctx;
}

auto request_context::make_child(std::optional<time_point> deadline,
                                 std::optional<uint32_t> try_number,
                                 std::optional<time_point> operation_start) const
    -> request_context {
    auto child = std::make_shared<state>();

    child->deadline = state_->deadline;
    if (deadline && (!child->deadline || *deadline < *child->deadline)) {
        child->deadline = deadline;
    }
    child->try_number = try_number.value_or(state_->try_number);
    child->operation_start = operation_start.value_or(state_->operation_start);

    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled.load()) {
            child->cancelled.store(true);
        } else {
            auto& kids = state_->children;
            kids.erase(std::remove_if(kids.begin(), kids.end(),
                                      [](const std::weak_ptr<state>& w) { return w.expired(); }),
                       kids.end());
            kids.push_back(child);
        }
    }

    return request_context(std::move(child));
}

auto request_context::with_deadline(time_point deadline) const -> request_context {
    return make_child(deadline, std::nullopt, std::nullopt);
}

auto request_context::begin_operation() const -> request_context {
    return make_child(std::nullopt, 0u, clock::now());
}

auto request_context::begin_try(uint32_t try_number,
                                std::optional<time_point> deadline) const -> request_context {
    return make_child(deadline, try_number, std::nullopt);
}

void request_context::cancel() const {
    cancel_tree(state_);
}

auto request_context::is_cancelled() const -> bool {
    return state_->cancelled.load();
}

auto request_context::deadline() const -> std::optional<time_point> {
    return state_->deadline;
}

auto request_context::deadline_exceeded() const -> bool {
    return state_->deadline && clock::now() >= *state_->deadline;
}

auto request_context::wait_for(std::chrono::milliseconds delay) const -> wait_status {
    auto until = clock::now() + delay;
    bool bounded_by_deadline = false;
    if (state_->deadline && *state_->deadline < until) {
        until = *state_->deadline;
        bounded_by_deadline = true;
    }

    std::unique_lock<std::mutex> lock(state_->mutex);
    bool cancelled = state_->cv.wait_until(lock, until, [this] {
        return state_->cancelled.load();
    });

    if (cancelled) {
        return wait_status::cancelled;
    }
    return bounded_by_deadline ? wait_status::deadline_exceeded : wait_status::elapsed;
}

auto request_context::try_number() const -> uint32_t {
    return state_->try_number;
}

auto request_context::operation_start() const -> time_point {
    return state_->operation_start;
}

}  // namespace kcenon::blob_storage
