#include "quota_gate.hpp"
#include <spdlog/spdlog.h>

QuotaGate::QuotaGate(std::shared_ptr<const PlanLimitResolver> plans,
                     std::shared_ptr<RateLimiter> rate_limiter,
                     std::shared_ptr<UsageBudgetTracker> budgets,
                     std::shared_ptr<const ResourceCounter> resources,
                     std::shared_ptr<AuditSink> audit)
    : plans_(std::move(plans))
    , rate_limiter_(std::move(rate_limiter))
    , budgets_(std::move(budgets))
    , resources_(std::move(resources))
    , audit_(std::move(audit))
{}

QuotaDecision QuotaGate::check(const QuotaRequest& request) {
    auto plan = plans_->resolve(request.plan_tier);

    QuotaDecision decision;
    decision.plan_tier = plan->tier;
    decision.budget_kind = request.budget_kind;
    decision.resource_kind = request.resource_kind;

    // 1. Static resource cap, only for resource-creating operations
    if (!request.resource_kind.empty()) {
        int64_t limit = plan->resource_limit(request.resource_kind);
        if (!is_unlimited(limit)) {
            int64_t current = resources_->count_resources(request.tenant_id, request.resource_kind);
            if (current >= limit) {
                decision.reason = DenialReason::StaticLimitExceeded;
                decision.current = current;
                decision.limit = limit;
                return deny(request, decision);
            }
        }
    }

    // 2. Request rate
    auto rate = rate_limiter_->try_consume(request.tenant_id, plan->rate);
    if (!rate.allowed) {
        decision.reason = DenialReason::RateLimited;
        decision.retry_after = rate.retry_after;
        decision.limit = plan->rate.max_requests;
        return deny(request, decision);
    }

    // 3. Monthly budget
    if (!request.budget_kind.empty()) {
        auto usage = budgets_->try_reserve(request.tenant_id, request.budget_kind,
                                           plan->monthly_budget(request.budget_kind));
        if (!usage.allowed) {
            decision.reason = DenialReason::UsageBudgetExceeded;
            decision.current = usage.current;
            decision.limit = usage.limit;
            return deny(request, decision);
        }
    }

    decision.allowed = true;
    return decision;
}

QuotaDecision QuotaGate::deny(const QuotaRequest& request, QuotaDecision decision) {
    decision.allowed = false;

    spdlog::info("Quota denied for tenant {} ({} plan): {} current={} limit={}",
                 request.tenant_id, decision.plan_tier, to_string(decision.reason),
                 decision.current, decision.limit);

    if (audit_) {
        audit_->emit_denial(request.tenant_id, decision);
    }
    return decision;
}
