#include "operation_runner.hpp"

ProtectedOperationRunner::ProtectedOperationRunner(std::shared_ptr<QuotaGate> gate,
                                                   std::shared_ptr<RetryExecutor> retry)
    : gate_(std::move(gate))
    , retry_(std::move(retry))
{}

void ProtectedOperationRunner::commit_usage(const OperationRequest& request,
                                            const std::string& correlation_id) {
    if (request.budget_kind.empty()) return;

    // Upstream already applied the change; ledger failures are only logged.
    try {
        gate_->budgets().commit(request.tenant_id, request.budget_kind,
                                request.amount, request.operation);
    } catch (const std::exception& e) {
        spdlog::error("Failed to commit {} usage for tenant {} [{}]: {}",
                      request.budget_kind, request.tenant_id, correlation_id, e.what());
    }
}
