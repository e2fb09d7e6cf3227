#pragma once

#include "audit.hpp"
#include "plan_limits.hpp"
#include "quota_decision.hpp"
#include "rate_limiter.hpp"
#include "resource_store.hpp"
#include "usage_budget.hpp"
#include <memory>

// Pre-flight admission for a tenant operation. Checks run cheapest first and
// stop at the first denial; a rate slot consumed before a later denial is
// not given back.
class QuotaGate {
public:
    QuotaGate(std::shared_ptr<const PlanLimitResolver> plans,
              std::shared_ptr<RateLimiter> rate_limiter,
              std::shared_ptr<UsageBudgetTracker> budgets,
              std::shared_ptr<const ResourceCounter> resources,
              std::shared_ptr<AuditSink> audit = nullptr);

    QuotaDecision check(const QuotaRequest& request);

    const PlanLimitResolver& plans() const { return *plans_; }
    RateLimiter& rate_limiter() { return *rate_limiter_; }
    UsageBudgetTracker& budgets() { return *budgets_; }

private:
    std::shared_ptr<const PlanLimitResolver> plans_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    std::shared_ptr<UsageBudgetTracker> budgets_;
    std::shared_ptr<const ResourceCounter> resources_;
    std::shared_ptr<AuditSink> audit_;

    QuotaDecision deny(const QuotaRequest& request, QuotaDecision decision);
};
