/**
 * @file pipeline.cpp
 * @brief Pipeline construction and dispatch
 * @version 0.1.0
 */

#include "kcenon/blob_storage/pipeline/pipeline.h"
#include "kcenon/blob_storage/core/logging.h"

#include <exception>

namespace kcenon::blob_storage {

namespace {

auto dispatch(const policy_list& policies, http_request& request,
              const request_context& context) -> result<http_response> {
    auto operation = context.begin_operation();
    next_policy first(policies, 0);
    return first.send(request, operation);
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

pipeline::pipeline(policy_list policies, std::size_t worker_count)
    : policies_(std::make_shared<const policy_list>(std::move(policies))),
      worker_count_(worker_count) {}

pipeline::~pipeline() = default;

auto pipeline::create(const std::shared_ptr<const credential>& cred,
                      pipeline_options options) -> result<std::shared_ptr<pipeline>> {
    if (!cred) {
        return unexpected{error{error_code::invalid_argument,
            "A credential is required; use anonymous_credential for public access"}};
    }

    auto retry = retry_policy::create(options.retry);
    if (!retry) {
        return unexpected{retry.error()};
    }

    auto transport = options.transport;
    if (!transport) {
        transport = make_network_http_transport();
    }

    policy_list policies;
    policies.reserve(7);
    policies.push_back(std::make_shared<telemetry_policy>(options.telemetry));
    policies.push_back(std::make_shared<request_id_policy>());
    policies.push_back(retry.value());
    policies.push_back(std::make_shared<date_policy>(options.service_version));
    policies.push_back(cred->create_policy());
    policies.push_back(std::make_shared<response_decoding_policy>());
    policies.push_back(std::make_shared<logging_policy>(options.logging));

    return create(std::move(policies), std::move(transport), options.worker_count);
}

auto pipeline::create(policy_list policies,
                      std::shared_ptr<http_transport> transport,
                      std::size_t worker_count) -> std::shared_ptr<pipeline> {
    get_logger().initialize();

    policies.push_back(std::make_shared<transport_policy>(std::move(transport)));
    return std::shared_ptr<pipeline>(new pipeline(std::move(policies), worker_count));
}

// ============================================================================
// Dispatch
// ============================================================================

auto pipeline::send(http_request request, const request_context& context) const
    -> result<http_response> {
    return dispatch(*policies_, request, context);
}

auto pipeline::send_async(http_request request, request_context context) const
    -> std::future<result<http_response>> {
    std::call_once(pool_once_, [this]() {
        pool_ = adapters::pipeline_pool_factory::create(worker_count_, "blob_storage_pipeline");
    });

    auto promise = std::make_shared<std::promise<result<http_response>>>();
    auto future = promise->get_future();

    // The task holds the policy list only, so dropping the pipeline while a
    // send is in flight never destroys the pool from one of its own workers
    pool_->submit(
        [policies = policies_, request = std::move(request), context = std::move(context),
         promise]() mutable {
            try {
                promise->set_value(dispatch(*policies, request, context));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });

    return future;
}

auto pipeline::policy_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(policies_->size());
    for (const auto& policy : *policies_) {
        names.emplace_back(policy->name());
    }
    return names;
}

}  // namespace kcenon::blob_storage
