#pragma once

#include "cancellation.hpp"
#include "operation_error.hpp"
#include "quota_gate.hpp"
#include "retry_executor.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

struct OperationRequest {
    std::string tenant_id;
    std::string plan_tier;
    std::string operation;
    std::string budget_kind;
    std::string resource_kind;
    int64_t amount = 1;
};

template <typename T>
struct OperationResult {
    std::optional<T> value;
    OperationError error;

    bool ok() const { return value.has_value(); }
};

// Entry point for business code: admission through the QuotaGate, the
// upstream call under the RetryExecutor, usage committed only on success.
class ProtectedOperationRunner {
public:
    ProtectedOperationRunner(std::shared_ptr<QuotaGate> gate,
                             std::shared_ptr<RetryExecutor> retry);

    template <typename Fn>
    OperationResult<std::invoke_result_t<Fn&>>
    execute(const OperationRequest& request, Fn&& fn,
            const CancellationToken* token = nullptr);

    template <typename Fn>
    OperationResult<std::invoke_result_t<Fn&>>
    execute(const std::string& tenant_id, const std::string& plan_tier,
            const std::string& budget_kind, Fn&& fn) {
        OperationRequest request;
        request.tenant_id = tenant_id;
        request.plan_tier = plan_tier;
        request.operation = budget_kind;
        request.budget_kind = budget_kind;
        return execute(request, std::forward<Fn>(fn));
    }

    QuotaGate& gate() { return *gate_; }

private:
    std::shared_ptr<QuotaGate> gate_;
    std::shared_ptr<RetryExecutor> retry_;

    void commit_usage(const OperationRequest& request, const std::string& correlation_id);
};

template <typename Fn>
OperationResult<std::invoke_result_t<Fn&>>
ProtectedOperationRunner::execute(const OperationRequest& request, Fn&& fn,
                                  const CancellationToken* token) {
    OperationResult<std::invoke_result_t<Fn&>> result;

    QuotaRequest quota;
    quota.tenant_id = request.tenant_id;
    quota.plan_tier = request.plan_tier;
    quota.budget_kind = request.budget_kind;
    quota.resource_kind = request.resource_kind;

    auto decision = gate_->check(quota);
    if (!decision.allowed) {
        result.error = OperationError::from_denial(decision);
        return result;
    }

    const std::string operation = request.operation.empty() ? "operation" : request.operation;
    const std::string correlation_id = util::generate_uuid();

    auto outcome = retry_->run_with_retry(operation, fn, token);
    if (!outcome.ok()) {
        result.error = OperationError::from_retry_failure(outcome.failure, correlation_id);
        spdlog::warn("Operation '{}' for tenant {} failed [{}]: {}",
                     operation, request.tenant_id, correlation_id, outcome.failure.message);
        return result;
    }

    commit_usage(request, correlation_id);
    result.value = std::move(outcome.value);
    return result;
}
